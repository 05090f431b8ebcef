/*
 * Increment Log - Crash-safe segment store for in-flight track points
 *
 * Buffered points are persisted as small immutable segment files
 * (increments/{token}_{seq}.inc), each written to a temp name and renamed
 * into place. On finalize, or after an unclean shutdown, the segments of a
 * session are merged in sequence order into one GPX file
 * (tracks/track_{token}.gpx) and only then deleted.
 */

#ifndef INCREMENT_LOG_HPP
#define INCREMENT_LOG_HPP

#include "types.h"
#include "logic/motion_analytics.hpp"
#include "utils/storage_interface.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum class MergeResult : uint8_t { Written, Empty, Failed };

/*============================================================================
 * Statistics
 *============================================================================*/
struct IncrementLogStats {
    uint32_t segments_written;     /* Segment files committed */
    uint32_t points_written;       /* Points in committed segments */
    uint32_t write_failures;       /* Segment writes abandoned */
    uint32_t files_skipped;        /* Unreadable segment files during read / merge */
    uint32_t lines_skipped;        /* Unparsable segment lines */
    uint32_t tracks_written;       /* Finalized GPX files committed */
    uint32_t merge_failures;       /* Merges abandoned */
    uint32_t files_deleted;
    uint32_t delete_failures;
};

/* One session left behind without a finalized track */
struct OrphanSession {
    std::string token;
    std::vector<std::string> files;   /* Segment file names, sequence order */
};

/*============================================================================
 * Increment Log Class
 *============================================================================*/
class Increment_Log {
public:
    explicit Increment_Log(Storage_Interface &storage) : storage_(storage) {}

    /* Disable copy/move */
    Increment_Log(const Increment_Log&) = delete;
    Increment_Log& operator=(const Increment_Log&) = delete;

    /**
     * @brief Create the segment and track directories.
     * @return true if both exist afterwards
     */
    bool init();

    /**
     * @brief Persist one batch of points as segment (token, seq).
     * Written to "{name}.tmp", closed, then renamed. An empty batch is a
     * successful no-op. On any failure the temp file is removed.
     * @return true if the segment is durable
     */
    bool write_segment(const char *token, uint32_t seq, const TrackPoint *points, size_t count);

    /**
     * @brief Sessions with segments but no finalized track, oldest token first.
     * @return false if the segment directory could not be listed
     */
    bool list_orphan_sessions(std::vector<OrphanSession> &sessions);

    /**
     * @brief Segment file names of one token, sequence order.
     */
    bool list_segments(const char *token, std::vector<std::string> &files);

    /**
     * @brief Append every readable point of the given segment files, in order.
     * Unreadable files and unparsable lines are skipped and counted.
     * @return number of points appended
     */
    size_t read_segments(const std::vector<std::string> &files, std::vector<TrackPoint> &points);

    /**
     * @brief Stream segments into tracks/track_{token}.gpx via a temp file.
     * Nothing is left behind for Empty or Failed. The segments are not touched.
     * @param summary optional, filled for Written
     */
    MergeResult merge_to_final_track(const char *token, const std::vector<std::string> &files,
                                     TrackSummary *summary = nullptr);

    /**
     * @brief Remove every segment and segment temp file of a token.
     * @return true if nothing of the token remains
     */
    bool delete_segments(const char *token);

    /**
     * @brief Clean up after a crash between merge and delete.
     * Deletes segments of tokens that already have a finalized track, and
     * half-written track temp files.
     * @return number of files removed
     */
    uint32_t purge_finalized_leftovers();

    bool final_track_exists(const char *token);

    /**
     * @brief Read a finalized GPX track back into points.
     * @return false if the file could not be opened
     */
    bool read_track(const char *path, std::vector<TrackPoint> &points);

    IncrementLogStats get_stats() const { return stats_; }

private:
    bool segment_path(const char *name, char *buf, size_t cap) const;
    bool track_path(const char *token, char *buf, size_t cap) const;
    bool remove_counted(const char *path);
    void abandon_merge(const char *tmp_path);

    /* Calls fn(point) for every readable point, in file order */
    template <typename Fn>
    void scan_segments(const std::vector<std::string> &files, Fn &&fn);

    Storage_Interface &storage_;
    IncrementLogStats stats_ = {};
};

#endif // INCREMENT_LOG_HPP
