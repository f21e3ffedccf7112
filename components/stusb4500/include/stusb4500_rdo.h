#pragma once

#include <stdint.h>

// Request data object reported by RDO_REG_STATUS. Read-only.
class Rdo {
public:
    Rdo() = default;
    explicit Rdo(uint32_t raw) : raw_(raw) {}

    // 1-based index of the requested PDO; 0 when no contract exists
    uint8_t position() const;
    bool giveBack() const;
    bool capabilityMismatch() const;
    bool usbCommunicationCapable() const;
    bool noUsbSuspend() const;
    bool unchunkedExtendedMessages() const;
    // 10mA units
    uint16_t operatingCurrent() const;
    uint16_t maxOperatingCurrent() const;

    uint32_t bits() const { return raw_; }

private:
    uint32_t raw_ = 0;
};
