/*
 * Storage_Interface - Abstract file store for segment and track files
 * Decouples persistence logic from the filesystem (FatFS on SD / in-memory in tests)
 *
 * Paths are '/'-separated and relative to the volume root. At most one file
 * is open for writing and one for reading at a time.
 */

#ifndef STORAGE_INTERFACE_HPP
#define STORAGE_INTERFACE_HPP

#include <cstddef>
#include <string>
#include <vector>

class Storage_Interface {
public:
    virtual ~Storage_Interface() = default;

    /* Succeeds if the directory already exists */
    virtual bool make_dir(const char *path) = 0;

    /* Appends plain file names (no directory part); false if unreadable */
    virtual bool list_dir(const char *path, std::vector<std::string> &names) = 0;
    virtual bool exists(const char *path) = 0;

    /* Create or truncate */
    virtual bool open_write(const char *path) = 0;
    virtual bool write(const char *data, size_t len) = 0;
    /* Flushes and closes; false if any buffered data failed to reach the medium */
    virtual bool close_write() = 0;

    virtual bool open_read(const char *path) = 0;
    /*
     * fgets semantics: up to cap-1 bytes, stops after '\n' (kept), always
     * NUL-terminated. Returns false at end of file or on error.
     */
    virtual bool read_line(char *buf, size_t cap) = 0;
    virtual void close_read() = 0;

    /* Replaces an existing destination */
    virtual bool rename(const char *from, const char *to) = 0;
    virtual bool remove(const char *path) = 0;
};

#endif // STORAGE_INTERFACE_HPP
