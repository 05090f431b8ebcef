/*
 * FatFS_Storage Implementation
 * Single static write handle and read handle, matching the
 * one-writer-one-reader contract of Storage_Interface
 */

#include "drivers/fatfs_storage.hpp"
#include "pico/stdlib.h"

/* FatFS headers */
extern "C" {
#include "ff.h"
#include "f_util.h"
#include "hw_config.h"
}

#include <cstdio>
#include <cstring>

static void bump(uint32_t &counter) {
    if (counter < UINT32_MAX) {
        counter++;
    }
}

/*============================================================================
 * Lifecycle
 *============================================================================*/

FatFS_Storage::~FatFS_Storage() {
    deinit();
}

bool FatFS_Storage::init() {
    stats_ = {};
    if (!mount_filesystem()) {
        return false;
    }
    mounted_ = true;
    return true;
}

void FatFS_Storage::deinit() {
    if (write_file_ != nullptr) {
        close_write();
    }
    close_read();

    if (fatfs_ != nullptr) {
        f_unmount("");
        fatfs_ = nullptr;
    }
    mounted_ = false;
}

bool FatFS_Storage::mount_filesystem() {
    static FATFS fatfs;
    fatfs_ = &fatfs;

    FRESULT fr = f_mount(&fatfs, "", 1);  /* Mount immediately */
    if (fr != FR_OK) {
        printf("[SD] Mount failed: %s (%d)\n", FRESULT_str(fr), fr);
        fatfs_ = nullptr;
        return false;
    }

    printf("[SD] Mounted OK\n");
    return true;
}

bool FatFS_Storage::try_recovery() {
    bump(stats_.recovery_attempts);
    printf("[SD] Attempting recovery (attempt %lu)...\n",
           static_cast<unsigned long>(stats_.recovery_attempts));

    /* Handles are invalid after a card error; drop them without flushing */
    if (write_file_ != nullptr) {
        f_close(static_cast<FIL*>(write_file_));
        write_file_ = nullptr;
    }
    close_read();
    if (fatfs_ != nullptr) {
        f_unmount("");
        fatfs_ = nullptr;
    }
    mounted_ = false;

    if (!mount_filesystem()) {
        printf("[SD] Recovery mount failed\n");
        return false;
    }
    mounted_ = true;
    printf("[SD] Recovery successful\n");
    return true;
}

StorageStats FatFS_Storage::get_stats() const {
    stats_.mounted = mounted_;
    return stats_;
}

/*============================================================================
 * Directories
 *============================================================================*/

bool FatFS_Storage::make_dir(const char *path) {
    if (!mounted_) {
        return false;
    }
    FRESULT fr = f_mkdir(path);
    if (fr != FR_OK && fr != FR_EXIST) {
        printf("[SD] Failed to create %s/: %s (%d)\n", path, FRESULT_str(fr), fr);
        return false;
    }
    return true;
}

bool FatFS_Storage::list_dir(const char *path, std::vector<std::string> &names) {
    if (!mounted_) {
        return false;
    }

    DIR dir;
    FILINFO fno;
    FRESULT fr = f_opendir(&dir, path);
    if (fr != FR_OK) {
        printf("[SD] Cannot list %s: %s (%d)\n", path, FRESULT_str(fr), fr);
        return false;
    }

    bool ok = true;
    while (true) {
        fr = f_readdir(&dir, &fno);
        if (fr != FR_OK) {
            printf("[SD] Listing %s aborted: %s (%d)\n", path, FRESULT_str(fr), fr);
            ok = false;
            break;
        }
        if (fno.fname[0] == '\0') {
            break;
        }
        if ((fno.fattrib & AM_DIR) == 0) {
            names.emplace_back(fno.fname);
        }
    }
    f_closedir(&dir);
    return ok;
}

bool FatFS_Storage::exists(const char *path) {
    if (!mounted_) {
        return false;
    }
    FILINFO fno;
    return f_stat(path, &fno) == FR_OK;
}

/*============================================================================
 * Writing
 *============================================================================*/

bool FatFS_Storage::open_write(const char *path) {
    if (!mounted_ || write_file_ != nullptr) {
        return false;
    }

    static FIL write_fil;
    FRESULT fr = f_open(&write_fil, path, FA_CREATE_ALWAYS | FA_WRITE);
    if (fr != FR_OK) {
        printf("[SD] Failed to create %s: %s (%d)\n", path, FRESULT_str(fr), fr);
        bump(stats_.write_errors);
        return false;
    }
    write_file_ = &write_fil;
    write_failed_ = false;
    return true;
}

bool FatFS_Storage::write(const char *data, size_t len) {
    if (write_file_ == nullptr || write_failed_) {
        return false;
    }

    UINT bw;
    FRESULT fr = f_write(static_cast<FIL*>(write_file_), data, static_cast<UINT>(len), &bw);
    if (fr != FR_OK || bw != static_cast<UINT>(len)) {
        /* A short write means the volume is full */
        printf("[SD] Write error: %s (%d) %u/%u bytes\n", FRESULT_str(fr), fr,
               static_cast<unsigned>(bw), static_cast<unsigned>(len));
        bump(stats_.write_errors);
        write_failed_ = true;
        return false;
    }
    return true;
}

bool FatFS_Storage::close_write() {
    if (write_file_ == nullptr) {
        return false;
    }

    FIL* fil = static_cast<FIL*>(write_file_);
    bool ok = !write_failed_;

    FRESULT fr = f_close(fil);  /* f_close syncs first */
    if (fr != FR_OK) {
        printf("[SD] Close failed: %s (%d)\n", FRESULT_str(fr), fr);
        bump(stats_.write_errors);
        ok = false;
    }
    write_file_ = nullptr;
    write_failed_ = false;

    if (ok) {
        bump(stats_.files_written);
    }
    return ok;
}

/*============================================================================
 * Reading
 *============================================================================*/

bool FatFS_Storage::open_read(const char *path) {
    if (!mounted_ || read_file_ != nullptr) {
        return false;
    }

    static FIL read_fil;
    FRESULT fr = f_open(&read_fil, path, FA_OPEN_EXISTING | FA_READ);
    if (fr != FR_OK) {
        printf("[SD] Failed to open %s: %s (%d)\n", path, FRESULT_str(fr), fr);
        bump(stats_.read_errors);
        return false;
    }
    read_file_ = &read_fil;
    return true;
}

bool FatFS_Storage::read_line(char *buf, size_t cap) {
    if (read_file_ == nullptr || buf == nullptr || cap < 2) {
        return false;
    }

    FIL* fil = static_cast<FIL*>(read_file_);
    if (f_gets(buf, static_cast<int>(cap), fil) == nullptr) {
        if (f_error(fil)) {
            bump(stats_.read_errors);
        }
        buf[0] = '\0';
        return false;
    }
    return true;
}

void FatFS_Storage::close_read() {
    if (read_file_ != nullptr) {
        f_close(static_cast<FIL*>(read_file_));
        read_file_ = nullptr;
    }
}

/*============================================================================
 * Rename / Remove
 *============================================================================*/

bool FatFS_Storage::rename(const char *from, const char *to) {
    if (!mounted_) {
        return false;
    }

    /* f_rename refuses an existing destination */
    FRESULT fr = f_unlink(to);
    if (fr != FR_OK && fr != FR_NO_FILE) {
        printf("[SD] Cannot replace %s: %s (%d)\n", to, FRESULT_str(fr), fr);
        return false;
    }

    fr = f_rename(from, to);
    if (fr != FR_OK) {
        printf("[SD] Rename %s -> %s failed: %s (%d)\n", from, to, FRESULT_str(fr), fr);
        return false;
    }
    return true;
}

bool FatFS_Storage::remove(const char *path) {
    if (!mounted_) {
        return false;
    }

    FRESULT fr = f_unlink(path);
    if (fr != FR_OK) {
        printf("[SD] Remove %s failed: %s (%d)\n", path, FRESULT_str(fr), fr);
        return false;
    }
    return true;
}
