#pragma once

#include "esp_err.h"

#include <stdint.h>

// Power data object type, bits 31:30 of the PDO word
enum class PdoType : uint8_t {
    Fixed = 0,
    Variable = 1,
    Battery = 2,
    Augmented = 3,
};

// Fast Role Swap current advertised by a fixed sink PDO, bits 24:23
enum class FastSwapSupport : uint8_t {
    NotSupported = 0,
    DefaultUsb = 1,     // 0.5A @ 5V
    Current1A5 = 2,     // 1.5A @ 5V
    Current3A0 = 3,     // 3.0A @ 5V
};

FastSwapSupport fastSwapFromBits(uint32_t value);
uint32_t fastSwapToBits(FastSwapSupport support);
const char* fastSwapToString(FastSwapSupport support);
const char* pdoTypeToString(PdoType type);

class FixedPdo {
public:
    FixedPdo() = default;
    explicit FixedPdo(uint32_t raw) : raw_(raw) {}

    bool dualRolePower() const;
    void setDualRolePower(bool enabled);
    bool higherCapability() const;
    void setHigherCapability(bool enabled);
    bool unconstrainedPower() const;
    void setUnconstrainedPower(bool enabled);
    bool usbCommunicationsCapable() const;
    void setUsbCommunicationsCapable(bool enabled);
    bool dualRoleData() const;
    void setDualRoleData(bool enabled);
    FastSwapSupport fastRoleSwap() const;
    void setFastRoleSwap(FastSwapSupport support);

    // 50mV units
    uint16_t voltage() const;
    void setVoltage(uint16_t voltage);
    // 10mA units
    uint16_t current() const;
    void setCurrent(uint16_t current);

    uint32_t bits() const { return raw_; }

private:
    uint32_t raw_ = 0x00000000;
};

class VariablePdo {
public:
    VariablePdo() = default;
    explicit VariablePdo(uint32_t raw) : raw_(raw) {}

    uint16_t maxVoltage() const;
    void setMaxVoltage(uint16_t voltage);
    uint16_t minVoltage() const;
    void setMinVoltage(uint16_t voltage);
    uint16_t current() const;
    void setCurrent(uint16_t current);

    uint32_t bits() const { return raw_; }

private:
    uint32_t raw_ = 0x40000000;
};

class BatteryPdo {
public:
    BatteryPdo() = default;
    explicit BatteryPdo(uint32_t raw) : raw_(raw) {}

    uint16_t maxVoltage() const;
    void setMaxVoltage(uint16_t voltage);
    uint16_t minVoltage() const;
    void setMinVoltage(uint16_t voltage);
    // 250mW units
    uint16_t power() const;
    void setPower(uint16_t power);

    uint32_t bits() const { return raw_; }

private:
    uint32_t raw_ = 0x80000000;
};

// Programmable power supply APDO
class AugmentedPdo {
public:
    AugmentedPdo() = default;
    explicit AugmentedPdo(uint32_t raw) : raw_(raw) {}

    uint8_t programmableDevice() const;
    // 100mV units
    uint16_t maxVoltage() const;
    void setMaxVoltage(uint16_t voltage);
    uint16_t minVoltage() const;
    void setMinVoltage(uint16_t voltage);
    // 50mA units
    uint16_t maxCurrent() const;
    void setMaxCurrent(uint16_t current);

    uint32_t bits() const { return raw_; }

private:
    uint32_t raw_ = 0xC0000000;
};

// A sink PDO word tagged by its type bits. The stored word is the encoding.
class Pdo {
public:
    Pdo() = default;

    static Pdo fromBits(uint32_t raw);
    // Raw 10-bit fields, truncated
    static Pdo fixed(uint16_t voltage, uint16_t current);
    static esp_err_t fixedFromUnits(uint32_t voltage_mv, uint32_t current_ma, Pdo* pdo);

    PdoType type() const { return static_cast<PdoType>(raw_ >> 30); }
    uint32_t bits() const { return raw_; }

    esp_err_t asFixed(FixedPdo* pdo) const;
    esp_err_t asVariable(VariablePdo* pdo) const;
    esp_err_t asBattery(BatteryPdo* pdo) const;
    esp_err_t asAugmented(AugmentedPdo* pdo) const;

    // Fixed-only mutators; ESP_ERR_INVALID_STATE with the word untouched on other types
    esp_err_t setDualRolePower(bool enabled);
    esp_err_t setDualRoleData(bool enabled);
    esp_err_t setUsbCommunicationsCapable(bool enabled);
    esp_err_t setHigherCapability(bool enabled);
    esp_err_t setUnconstrainedPower(bool enabled);

    bool operator==(const Pdo& other) const { return raw_ == other.raw_; }
    bool operator!=(const Pdo& other) const { return raw_ != other.raw_; }

private:
    explicit Pdo(uint32_t raw) : raw_(raw) {}

    template <typename Setter>
    esp_err_t updateFixed(Setter setter);

    uint32_t raw_ = 0;
};
