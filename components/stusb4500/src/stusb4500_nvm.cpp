#include "stusb4500_nvm.h"
#include "stusb4500.h"

#include "esp_check.h"
#include "esp_log.h"

#include <string.h>

static const char* TAG = "stusb4500_nvm";

const uint8_t NvmSession::factory_defaults[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE] = {
    {0x00, 0x00, 0xB0, 0xAB, 0x00, 0x45, 0x00, 0x00},
    {0x10, 0x40, 0x9C, 0x1C, 0xFF, 0x01, 0x3C, 0xDF},
    {0x02, 0x40, 0x0F, 0x00, 0x32, 0x00, 0xFC, 0xF1},
    {0x00, 0x19, 0x56, 0xAF, 0xF5, 0x35, 0x5F, 0x00},
    {0x00, 0x4B, 0x90, 0x21, 0x43, 0x00, 0x40, 0xFB}
};

uint8_t NvmCommand::toRegister() const
{
    uint8_t value = static_cast<uint8_t>(opcode_) & STUSB4500_FTP_CUST_OPCODE;
    if (opcode_ == Opcode::LoadSer) {
        value |= (erase_mask_ << STUSB4500_FTP_CUST_SER_SHIFT) & STUSB4500_FTP_CUST_SER;
    }
    return value;
}

NvmSession::~NvmSession()
{
    if (device_ == nullptr) {
        return;
    }

    esp_err_t ret = lock();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to lock NVM on session exit: %s", esp_err_to_name(ret));
    }
}

NvmSession::NvmSession(NvmSession&& other) noexcept
    : device_(other.device_), config_(other.config_)
{
    other.device_ = nullptr;
}

NvmSession& NvmSession::operator=(NvmSession&& other) noexcept
{
    if (this != &other) {
        if (device_ != nullptr) {
            esp_err_t ret = lock();
            if (ret != ESP_OK) {
                ESP_LOGE(TAG, "Failed to lock replaced NVM session: %s", esp_err_to_name(ret));
            }
        }

        device_ = other.device_;
        config_ = other.config_;
        other.device_ = nullptr;
    }
    return *this;
}

esp_err_t NvmSession::unlock(STUSB4500& device, const NvmConfig& config)
{
    RegisterBus& bus = device.bus_;

    ESP_RETURN_ON_ERROR(bus.writeRegister(STUSB4500_REG_FTP_CUST_PASSWORD_REG, STUSB4500_FTP_CUST_PASSWORD),
        TAG, "Failed to write NVM password");
    // NVM internal controller reset
    ESP_RETURN_ON_ERROR(bus.writeRegister(STUSB4500_REG_FTP_CTRL_0, 0x00),
        TAG, "Failed to reset NVM controller");
    ESP_RETURN_ON_ERROR(bus.writeRegister(STUSB4500_REG_FTP_CTRL_0, STUSB4500_FTP_CUST_PWR | STUSB4500_FTP_CUST_RST_N),
        TAG, "Failed to power NVM controller");

    device_ = &device;
    config_ = config;
    device.nvm_unlocked_ = true;

    ESP_LOGD(TAG, "NVM unlocked");
    return ESP_OK;
}

void NvmSession::release()
{
    if (device_ != nullptr) {
        device_->nvm_unlocked_ = false;
        device_ = nullptr;
    }
}

esp_err_t NvmSession::lock()
{
    if (device_ == nullptr) {
        return ESP_ERR_INVALID_STATE;
    }

    RegisterBus& bus = device_->bus_;
    esp_err_t ret = bus.writeRegister(STUSB4500_REG_FTP_CTRL_0, STUSB4500_FTP_CUST_RST_N);
    if (ret == ESP_OK) {
        ret = bus.writeRegister(STUSB4500_REG_FTP_CTRL_1, 0x00);
    }
    if (ret == ESP_OK) {
        ret = bus.writeRegister(STUSB4500_REG_FTP_CUST_PASSWORD_REG, 0x00);
    }

    // The device is handed back even if the chip did not acknowledge the lock
    release();

    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "NVM lock sequence failed: %s", esp_err_to_name(ret));
        return ret;
    }

    ESP_LOGD(TAG, "NVM locked");
    return ESP_OK;
}

esp_err_t NvmSession::writeCommand(const NvmCommand& command)
{
    return device_->bus_.writeRegister(STUSB4500_REG_FTP_CTRL_1, command.toRegister());
}

esp_err_t NvmSession::issueRequest(uint8_t sector)
{
    RegisterBus& bus = device_->bus_;

    esp_err_t ret = bus.writeRegister(STUSB4500_REG_FTP_CTRL_0,
        (sector & STUSB4500_FTP_CUST_SECT) | STUSB4500_FTP_CUST_PWR |
        STUSB4500_FTP_CUST_RST_N | STUSB4500_FTP_CUST_REQ);
    if (ret != ESP_OK) return ret;

    for (uint32_t attempt = 0; attempt < config_.poll_attempts; attempt++) {
        uint8_t status = 0;
        ret = bus.readRegister(STUSB4500_REG_FTP_CTRL_0, &status);
        if (ret != ESP_OK) return ret;

        if ((status & STUSB4500_FTP_CUST_REQ) == 0) {
            return ESP_OK;
        }

        if (config_.poll_interval_ms > 0 && attempt + 1 < config_.poll_attempts) {
            bus.delayMs(config_.poll_interval_ms);
        }
    }

    ESP_LOGE(TAG, "NVM request timeout: sector=%u, polls=%lu", sector, (unsigned long)config_.poll_attempts);
    return ESP_ERR_TIMEOUT;
}

esp_err_t NvmSession::readSector(uint8_t sector, uint8_t data[STUSB4500_NVM_SECTOR_SIZE])
{
    esp_err_t ret = writeCommand(NvmCommand::readSector());
    if (ret != ESP_OK) return ret;

    ret = issueRequest(sector);
    if (ret != ESP_OK) return ret;

    return device_->bus_.read(STUSB4500_REG_RW_BUFFER, data, STUSB4500_NVM_SECTOR_SIZE);
}

esp_err_t NvmSession::writeSector(uint8_t sector, const uint8_t data[STUSB4500_NVM_SECTOR_SIZE])
{
    esp_err_t ret = device_->bus_.write(STUSB4500_REG_RW_BUFFER, data, STUSB4500_NVM_SECTOR_SIZE);
    if (ret != ESP_OK) return ret;

    // Sector select is ignored while loading the program load register
    ret = writeCommand(NvmCommand::loadPlr());
    if (ret != ESP_OK) return ret;
    ret = issueRequest(0);
    if (ret != ESP_OK) return ret;

    ret = writeCommand(NvmCommand::writeSector());
    if (ret != ESP_OK) return ret;
    return issueRequest(sector);
}

esp_err_t NvmSession::eraseSectors()
{
    esp_err_t ret = writeCommand(NvmCommand::loadSer(STUSB4500_NVM_ALL_SECTORS));
    if (ret != ESP_OK) return ret;
    ret = issueRequest(0);
    if (ret != ESP_OK) return ret;

    ret = writeCommand(NvmCommand::eraseSectors());
    if (ret != ESP_OK) return ret;
    return issueRequest(0);
}

esp_err_t NvmSession::readSectors(uint8_t sectors[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE])
{
    if (device_ == nullptr) {
        return ESP_ERR_INVALID_STATE;
    }
    if (sectors == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    for (uint8_t i = 0; i < STUSB4500_NVM_SECTOR_COUNT; i++) {
        esp_err_t ret = readSector(i, sectors[i]);
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "Failed to read NVM sector %u: %s", i, esp_err_to_name(ret));
            return ret;
        }
    }

    ESP_LOGI(TAG, "Read %d NVM sectors", STUSB4500_NVM_SECTOR_COUNT);
    return ESP_OK;
}

esp_err_t NvmSession::writeSectors(const uint8_t sectors[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE])
{
    if (device_ == nullptr) {
        return ESP_ERR_INVALID_STATE;
    }
    if (sectors == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    esp_err_t ret = eraseSectors();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to erase NVM: %s", esp_err_to_name(ret));
        return ret;
    }

    for (uint8_t i = 0; i < STUSB4500_NVM_SECTOR_COUNT; i++) {
        ret = writeSector(i, sectors[i]);
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "Failed to program NVM sector %u: %s", i, esp_err_to_name(ret));
            return ret;
        }
    }

    ESP_LOGI(TAG, "Programmed %d NVM sectors", STUSB4500_NVM_SECTOR_COUNT);
    return ESP_OK;
}

esp_err_t nvmImageFromBlob(const uint8_t* blob, size_t len,
    uint8_t sectors[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE])
{
    if (blob == nullptr || sectors == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }
    if (len != STUSB4500_NVM_IMAGE_SIZE) {
        ESP_LOGE(TAG, "NVM image must be %d bytes, got %u", STUSB4500_NVM_IMAGE_SIZE, (unsigned)len);
        return ESP_ERR_INVALID_SIZE;
    }

    for (int i = 0; i < STUSB4500_NVM_SECTOR_COUNT; i++) {
        memcpy(sectors[i], blob + i * STUSB4500_NVM_SECTOR_SIZE, STUSB4500_NVM_SECTOR_SIZE);
    }
    return ESP_OK;
}

esp_err_t nvmImageToBlob(const uint8_t sectors[STUSB4500_NVM_SECTOR_COUNT][STUSB4500_NVM_SECTOR_SIZE],
    uint8_t* blob, size_t len)
{
    if (blob == nullptr || sectors == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }
    if (len != STUSB4500_NVM_IMAGE_SIZE) {
        return ESP_ERR_INVALID_SIZE;
    }

    for (int i = 0; i < STUSB4500_NVM_SECTOR_COUNT; i++) {
        memcpy(blob + i * STUSB4500_NVM_SECTOR_SIZE, sectors[i], STUSB4500_NVM_SECTOR_SIZE);
    }
    return ESP_OK;
}
