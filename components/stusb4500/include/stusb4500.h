#pragma once

#include "esp_err.h"
#include "register_bus.h"
#include "stusb4500_nvm.h"
#include "stusb4500_pdo.h"
#include "stusb4500_rdo.h"
#include "stusb4500_types.h"

#include <stdint.h>

class STUSB4500 {
public:
    explicit STUSB4500(RegisterBus& bus);

    STUSB4500(const STUSB4500&) = delete;
    STUSB4500& operator=(const STUSB4500&) = delete;

    // Probes the device id and clears pending alerts
    esp_err_t begin();

    // Device identification
    esp_err_t readDeviceId(uint8_t* device_id);
    static bool isSupportedDeviceId(uint8_t device_id);

    // NVM access. The device is unavailable until the session is locked.
    esp_err_t unlockNvm(NvmSession* session, const NvmConfig& config = NvmConfig());
    bool isNvmUnlocked() const { return nvm_unlocked_; }

    // Sink PDOs (volatile copy negotiated with the source)
    esp_err_t getPdoCount(uint8_t* pdo_count);
    esp_err_t setPdoCount(uint8_t pdo_count);
    esp_err_t getPdo(stusb4500_pdo_channel_t channel, Pdo* pdo);
    esp_err_t setPdo(stusb4500_pdo_channel_t channel, const Pdo& pdo);

    // Negotiation state
    esp_err_t getCurrentRdo(Rdo* rdo);
    esp_err_t readVoltage(uint16_t* voltage_mv);
    esp_err_t readNegotiationStatus(stusb4500_negotiation_status_t* status);
    esp_err_t readCcStatus(stusb4500_cc_status_t* status);
    esp_err_t readPdTypecStatus(stusb4500_pd_typec_status_t* status);
    esp_err_t readPrtStatus(stusb4500_prt_status_t* status);
    esp_err_t clearAlertStatus();

    // Makes the sink renegotiate with the source
    esp_err_t softReset();

    static const char* ccStateToString(stusb4500_cc_state_t state);
    static const char* typecFsmStateToString(stusb4500_typec_fsm_state_t state);

private:
    friend class NvmSession;

    esp_err_t checkAvailable() const;
    esp_err_t readRegister(uint8_t reg, uint8_t* value);
    esp_err_t readWord(uint8_t reg, uint32_t* value);
    esp_err_t writeWord(uint8_t reg, uint32_t value);
    static uint8_t pdoRegister(stusb4500_pdo_channel_t channel);

    RegisterBus& bus_;
    bool nvm_unlocked_ = false;
};
