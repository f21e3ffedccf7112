#pragma once

#include "esp_err.h"
#include "stusb4500_config.h"
#include "stusb4500_types.h"

#include <stddef.h>
#include <stdint.h>

class STUSB4500;

// Erase-sector flags carried by the LoadSer command
#define STUSB4500_NVM_SECTOR_0                  0x01
#define STUSB4500_NVM_SECTOR_1                  0x02
#define STUSB4500_NVM_SECTOR_2                  0x04
#define STUSB4500_NVM_SECTOR_3                  0x08
#define STUSB4500_NVM_SECTOR_4                  0x10
#define STUSB4500_NVM_ALL_SECTORS               0x1F

struct NvmConfig {
    uint32_t poll_attempts = CONFIG_STUSB4500_NVM_POLL_ATTEMPTS;
    uint32_t poll_interval_ms = CONFIG_STUSB4500_NVM_POLL_INTERVAL_MS;
};

// Value written to FTP_CTRL_1. The erase mask only exists for LoadSer and is
// packed into the register byte by toRegister().
class NvmCommand {
public:
    enum class Opcode : uint8_t {
        ReadSector = 0x00,
        LoadPlr = 0x01,         // load RW buffer into program load register
        LoadSer = 0x02,         // load sector erase register
        EraseSectors = 0x05,
        WriteSector = 0x06,
    };

    static NvmCommand readSector() { return NvmCommand(Opcode::ReadSector, 0); }
    static NvmCommand loadPlr() { return NvmCommand(Opcode::LoadPlr, 0); }
    static NvmCommand loadSer(uint8_t erase_mask) { return NvmCommand(Opcode::LoadSer, erase_mask & STUSB4500_NVM_ALL_SECTORS); }
    static NvmCommand eraseSectors() { return NvmCommand(Opcode::EraseSectors, 0); }
    static NvmCommand writeSector() { return NvmCommand(Opcode::WriteSector, 0); }

    Opcode opcode() const { return opcode_; }
    uint8_t eraseMask() const { return erase_mask_; }
    uint8_t toRegister() const;

private:
    NvmCommand(Opcode opcode, uint8_t erase_mask) : opcode_(opcode), erase_mask_(erase_mask) {}

    Opcode opcode_;
    uint8_t erase_mask_;
};

/**
 * Unlocked NVM programming session.
 *
 * Obtained from STUSB4500::unlockNvm(). While the session is open the device
 * refuses every other register access. lock() restores the locked state and
 * reports its own error; a session that is still unlocked when destroyed is
 * locked by the destructor.
 */
class NvmSession {
public:
    // Vendor default configuration as produced by the ST GUI
    static const uint8_t factory_defaults[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE];

    NvmSession() = default;
    ~NvmSession();

    NvmSession(const NvmSession&) = delete;
    NvmSession& operator=(const NvmSession&) = delete;
    NvmSession(NvmSession&& other) noexcept;
    NvmSession& operator=(NvmSession&& other) noexcept;

    bool isUnlocked() const { return device_ != nullptr; }

    esp_err_t readSectors(uint8_t sectors[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE]);
    // Erases all sectors, then programs them in ascending order. No rollback on failure.
    esp_err_t writeSectors(const uint8_t sectors[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE]);
    esp_err_t lock();

private:
    friend class STUSB4500;

    esp_err_t unlock(STUSB4500& device, const NvmConfig& config);
    void release();

    esp_err_t writeCommand(const NvmCommand& command);
    esp_err_t issueRequest(uint8_t sector);
    esp_err_t readSector(uint8_t sector, uint8_t data[STUSB4500_NVM_SECTOR_SIZE]);
    esp_err_t writeSector(uint8_t sector, const uint8_t data[STUSB4500_NVM_SECTOR_SIZE]);
    esp_err_t eraseSectors();

    STUSB4500* device_ = nullptr;
    NvmConfig config_;
};

// Flat 40-byte image layout used by NVM dump files, sector 0 first
esp_err_t nvmImageFromBlob(const uint8_t* blob, size_t len,
    uint8_t sectors[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE]);
esp_err_t nvmImageToBlob(const uint8_t sectors[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE],
    uint8_t* blob, size_t len);
