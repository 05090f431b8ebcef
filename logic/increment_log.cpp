/*
 * Increment Log Implementation
 * Segment write / recovery / merge over Storage_Interface
 */

#include "logic/increment_log.hpp"
#include "logic/track_format.hpp"
#include "config.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <map>
#include <utility>

/* Saturating counter increment */
static inline void bump(uint32_t &counter, uint32_t by = 1U) {
    counter = (counter > UINT32_MAX - by) ? UINT32_MAX : counter + by;
}

static bool ends_with(const std::string &s, const char *suffix) {
    size_t n = strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

/* GPX fragment scratch: one fully decorated track point */
static constexpr size_t GPX_CHUNK_MAX = 512U;

/*============================================================================
 * Paths
 *============================================================================*/

bool Increment_Log::segment_path(const char *name, char *buf, size_t cap) const {
    int len = snprintf(buf, cap, "%s/%s", INCREMENT_DIR, name);
    return len > 0 && static_cast<size_t>(len) < cap;
}

bool Increment_Log::track_path(const char *token, char *buf, size_t cap) const {
    char name[STORAGE_PATH_MAX];
    if (!track_file_name(token, name, sizeof(name))) {
        return false;
    }
    int len = snprintf(buf, cap, "%s/%s", TRACK_DIR, name);
    return len > 0 && static_cast<size_t>(len) < cap;
}

bool Increment_Log::remove_counted(const char *path) {
    if (storage_.remove(path)) {
        bump(stats_.files_deleted);
        return true;
    }
    bump(stats_.delete_failures);
    printf("[INC] Failed to delete %s\n", path);
    return false;
}

/*============================================================================
 * Lifecycle
 *============================================================================*/

bool Increment_Log::init() {
    bool ok = true;
    if (!storage_.make_dir(INCREMENT_DIR)) {
        printf("[INC] Failed to create %s/\n", INCREMENT_DIR);
        ok = false;
    }
    if (!storage_.make_dir(TRACK_DIR)) {
        printf("[INC] Failed to create %s/\n", TRACK_DIR);
        ok = false;
    }
    return ok;
}

/*============================================================================
 * Segment Write
 *============================================================================*/

bool Increment_Log::write_segment(const char *token, uint32_t seq,
                                  const TrackPoint *points, size_t count) {
    if (count == 0) {
        return true;
    }

    char name[STORAGE_PATH_MAX];
    char path[STORAGE_PATH_MAX];
    char tmp_path[STORAGE_PATH_MAX + 4U];
    if (!segment_file_name(token, seq, name, sizeof(name)) ||
        !segment_path(name, path, sizeof(path))) {
        bump(stats_.write_failures);
        return false;
    }
    snprintf(tmp_path, sizeof(tmp_path), "%s.tmp", path);

    if (!storage_.open_write(tmp_path)) {
        printf("[INC] Failed to create %s\n", tmp_path);
        bump(stats_.write_failures);
        return false;
    }

    char line[SEGMENT_LINE_MAX];
    bool ok = true;
    for (size_t i = 0; i < count && ok; i++) {
        int len = format_segment_line(points[i], line, sizeof(line));
        ok = len > 0 && storage_.write(line, static_cast<size_t>(len));
    }

    /* Close even after a failed write so the handle is released */
    if (!storage_.close_write()) {
        ok = false;
    }
    if (ok && !storage_.rename(tmp_path, path)) {
        ok = false;
    }

    if (!ok) {
        printf("[INC] Segment %s write failed, %lu points kept in memory\n", name,
               static_cast<unsigned long>(count));
        if (!storage_.remove(tmp_path)) {
            printf("[INC] Stale %s left behind\n", tmp_path);
        }
        bump(stats_.write_failures);
        return false;
    }

    bump(stats_.segments_written);
    bump(stats_.points_written, static_cast<uint32_t>(count));
    return true;
}

/*============================================================================
 * Discovery
 *============================================================================*/

bool Increment_Log::final_track_exists(const char *token) {
    char path[STORAGE_PATH_MAX];
    return track_path(token, path, sizeof(path)) && storage_.exists(path);
}

bool Increment_Log::list_orphan_sessions(std::vector<OrphanSession> &sessions) {
    std::vector<std::string> names;
    if (!storage_.list_dir(INCREMENT_DIR, names)) {
        return false;
    }

    /* token -> (seq, name); std::map keeps tokens in sortable order */
    std::map<std::string, std::vector<std::pair<uint32_t, std::string>>> groups;
    for (const std::string &name : names) {
        std::string token;
        uint32_t seq = 0;
        if (parse_segment_file_name(name.c_str(), token, seq)) {
            groups[token].emplace_back(seq, name);
        }
    }

    for (auto &group : groups) {
        if (final_track_exists(group.first.c_str())) {
            continue;
        }
        std::sort(group.second.begin(), group.second.end());

        OrphanSession session;
        session.token = group.first;
        for (const auto &entry : group.second) {
            session.files.push_back(entry.second);
        }
        sessions.push_back(std::move(session));
    }
    return true;
}

bool Increment_Log::list_segments(const char *token, std::vector<std::string> &files) {
    std::vector<std::string> names;
    if (!storage_.list_dir(INCREMENT_DIR, names)) {
        return false;
    }

    std::vector<std::pair<uint32_t, std::string>> found;
    for (const std::string &name : names) {
        std::string parsed;
        uint32_t seq = 0;
        if (parse_segment_file_name(name.c_str(), parsed, seq) && parsed == token) {
            found.emplace_back(seq, name);
        }
    }
    std::sort(found.begin(), found.end());
    for (const auto &entry : found) {
        files.push_back(entry.second);
    }
    return true;
}

/*============================================================================
 * Segment Read
 *============================================================================*/

template <typename Fn>
void Increment_Log::scan_segments(const std::vector<std::string> &files, Fn &&fn) {
    char path[STORAGE_PATH_MAX];
    char line[SEGMENT_LINE_MAX];

    for (const std::string &name : files) {
        if (!segment_path(name.c_str(), path, sizeof(path)) || !storage_.open_read(path)) {
            printf("[INC] Skipping unreadable segment %s\n", name.c_str());
            bump(stats_.files_skipped);
            continue;
        }

        while (storage_.read_line(line, sizeof(line))) {
            TrackPoint point;
            if (parse_segment_line(line, point)) {
                fn(point);
            } else {
                bump(stats_.lines_skipped);
            }
        }
        storage_.close_read();
    }
}

size_t Increment_Log::read_segments(const std::vector<std::string> &files,
                                    std::vector<TrackPoint> &points) {
    size_t appended = 0;
    scan_segments(files, [&](const TrackPoint &point) {
        points.push_back(point);
        appended++;
    });
    return appended;
}

/*============================================================================
 * Merge
 *============================================================================*/

void Increment_Log::abandon_merge(const char *tmp_path) {
    if (!storage_.remove(tmp_path)) {
        printf("[INC] Stale %s left behind\n", tmp_path);
    }
    bump(stats_.merge_failures);
}

MergeResult Increment_Log::merge_to_final_track(const char *token,
                                                const std::vector<std::string> &files,
                                                TrackSummary *summary) {
    char final_path[STORAGE_PATH_MAX];
    char tmp_path[STORAGE_PATH_MAX + 4U];
    if (!track_path(token, final_path, sizeof(final_path))) {
        bump(stats_.merge_failures);
        return MergeResult::Failed;
    }
    snprintf(tmp_path, sizeof(tmp_path), "%s.tmp", final_path);

    TrackSummaryBuilder builder;
    summary_begin(builder);

    bool opened = false;
    bool ok = true;
    char chunk[GPX_CHUNK_MAX];

    scan_segments(files, [&](const TrackPoint &point) {
        if (!ok) {
            return;
        }
        if (!opened) {
            /* Header names the track after its first point */
            if (!storage_.open_write(tmp_path)) {
                printf("[INC] Failed to create %s\n", tmp_path);
                ok = false;
                return;
            }
            opened = true;
            int len = gpx_format_header(point.timestamp_ms, chunk, sizeof(chunk));
            ok = len > 0 && storage_.write(chunk, static_cast<size_t>(len));
            if (!ok) {
                return;
            }
        }
        int len = gpx_format_point(point, chunk, sizeof(chunk));
        ok = len > 0 && storage_.write(chunk, static_cast<size_t>(len));
        summary_add(builder, point);
    });

    if (!opened) {
        if (!ok) {
            bump(stats_.merge_failures);
            return MergeResult::Failed;
        }
        return MergeResult::Empty;
    }

    if (ok) {
        int len = gpx_format_footer(chunk, sizeof(chunk));
        ok = len > 0 && storage_.write(chunk, static_cast<size_t>(len));
    }
    if (!storage_.close_write()) {
        ok = false;
    }
    if (!ok) {
        printf("[INC] Merge of %s failed while writing\n", token);
        abandon_merge(tmp_path);
        return MergeResult::Failed;
    }

    if (!storage_.rename(tmp_path, final_path)) {
        printf("[INC] Merge of %s failed at rename\n", token);
        abandon_merge(tmp_path);
        return MergeResult::Failed;
    }

    bump(stats_.tracks_written);
    if (summary != nullptr) {
        *summary = summary_finish(builder);
    }
    return MergeResult::Written;
}

/*============================================================================
 * Cleanup
 *============================================================================*/

bool Increment_Log::delete_segments(const char *token) {
    std::vector<std::string> names;
    if (!storage_.list_dir(INCREMENT_DIR, names)) {
        return false;
    }

    bool ok = true;
    char path[STORAGE_PATH_MAX];
    for (const std::string &name : names) {
        std::string base = name;
        if (ends_with(base, ".tmp")) {
            base.resize(base.size() - 4U);
        }

        std::string parsed;
        uint32_t seq = 0;
        if (!parse_segment_file_name(base.c_str(), parsed, seq) || parsed != token) {
            continue;
        }
        if (!segment_path(name.c_str(), path, sizeof(path)) || !remove_counted(path)) {
            ok = false;
        }
    }
    return ok;
}

uint32_t Increment_Log::purge_finalized_leftovers() {
    uint32_t removed = 0;
    char path[STORAGE_PATH_MAX];

    std::vector<std::string> names;
    if (storage_.list_dir(INCREMENT_DIR, names)) {
        std::map<std::string, bool> finalized;
        for (const std::string &name : names) {
            std::string base = name;
            if (ends_with(base, ".tmp")) {
                base.resize(base.size() - 4U);
            }
            std::string token;
            uint32_t seq = 0;
            if (!parse_segment_file_name(base.c_str(), token, seq)) {
                continue;
            }

            auto it = finalized.find(token);
            if (it == finalized.end()) {
                it = finalized.emplace(token, final_track_exists(token.c_str())).first;
            }
            if (it->second && segment_path(name.c_str(), path, sizeof(path)) &&
                remove_counted(path)) {
                removed++;
            }
        }
    }

    /* A track temp file means the merge never reached its rename */
    names.clear();
    if (storage_.list_dir(TRACK_DIR, names)) {
        for (const std::string &name : names) {
            if (!ends_with(name, ".gpx.tmp")) {
                continue;
            }
            int len = snprintf(path, sizeof(path), "%s/%s", TRACK_DIR, name.c_str());
            if (len > 0 && static_cast<size_t>(len) < sizeof(path) && remove_counted(path)) {
                removed++;
            }
        }
    }

    if (removed > 0) {
        printf("[INC] Purged %lu leftover files\n", static_cast<unsigned long>(removed));
    }
    return removed;
}

/*============================================================================
 * Track Read
 *============================================================================*/

bool Increment_Log::read_track(const char *path, std::vector<TrackPoint> &points) {
    if (!storage_.open_read(path)) {
        return false;
    }
    Gpx_Reader reader(points);
    char line[SEGMENT_LINE_MAX];
    while (storage_.read_line(line, sizeof(line))) {
        reader.feed(line);
    }
    storage_.close_read();
    return true;
}
