/*
 * FatFS_Storage - Storage_Interface over FatFS on the SDIO SD card
 */

#ifndef FATFS_STORAGE_HPP
#define FATFS_STORAGE_HPP

#include "config.h"
#include "utils/storage_interface.hpp"

#include <cstdint>

/*============================================================================
 * Storage Statistics
 *============================================================================*/
struct StorageStats {
    uint32_t files_written;        /* Write handles closed cleanly */
    uint32_t write_errors;         /* f_write / f_close / f_sync failures */
    uint32_t read_errors;
    uint32_t recovery_attempts;    /* Remount attempts */
    bool mounted;
};

/*============================================================================
 * FatFS Storage Class
 *============================================================================*/
class FatFS_Storage final : public Storage_Interface {
public:
    FatFS_Storage() = default;
    ~FatFS_Storage() override;

    /* Disable copy/move */
    FatFS_Storage(const FatFS_Storage&) = delete;
    FatFS_Storage& operator=(const FatFS_Storage&) = delete;
    FatFS_Storage(FatFS_Storage&&) = delete;
    FatFS_Storage& operator=(FatFS_Storage&&) = delete;

    /**
     * @brief Mount the card.
     * @return true if the volume is usable
     */
    bool init();

    /**
     * @brief Close open handles and unmount.
     * An open write handle is closed first so its data reaches the card.
     */
    void deinit();

    /**
     * @brief Unmount and mount again after a card error.
     * @return true if the volume is usable afterwards
     */
    bool try_recovery();

    bool is_mounted() const { return mounted_; }
    StorageStats get_stats() const;

    bool make_dir(const char *path) override;
    bool list_dir(const char *path, std::vector<std::string> &names) override;
    bool exists(const char *path) override;

    bool open_write(const char *path) override;
    bool write(const char *data, size_t len) override;
    bool close_write() override;

    bool open_read(const char *path) override;
    bool read_line(char *buf, size_t cap) override;
    void close_read() override;

    bool rename(const char *from, const char *to) override;
    bool remove(const char *path) override;

private:
    bool mount_filesystem();

    /* File handles (opaque pointers to avoid FatFS header pollution) */
    void* write_file_ = nullptr;    /* FIL* */
    void* read_file_ = nullptr;     /* FIL* */
    void* fatfs_ = nullptr;         /* FATFS* */

    bool mounted_ = false;
    bool write_failed_ = false;     /* Sticky until close_write() */

    mutable StorageStats stats_ = {};
};

#endif /* FATFS_STORAGE_HPP */
