#include "stusb4500_pdo.h"
#include "stusb4500_types.h"

#include "esp_log.h"

static const char* TAG = "stusb4500_pdo";

namespace {

constexpr uint32_t FIELD_10BIT = 0x3FF;

inline uint32_t getField(uint32_t raw, int shift, uint32_t mask)
{
    return (raw >> shift) & mask;
}

inline uint32_t setField(uint32_t raw, int shift, uint32_t mask, uint32_t value)
{
    return (raw & ~(mask << shift)) | ((value & mask) << shift);
}

inline bool getBit(uint32_t raw, int bit)
{
    return (raw >> bit) & 0x1;
}

inline uint32_t setBit(uint32_t raw, int bit, bool value)
{
    return value ? (raw | (1UL << bit)) : (raw & ~(1UL << bit));
}

}

FastSwapSupport fastSwapFromBits(uint32_t value)
{
    return static_cast<FastSwapSupport>(value & 0x3);
}

uint32_t fastSwapToBits(FastSwapSupport support)
{
    return static_cast<uint32_t>(support);
}

const char* fastSwapToString(FastSwapSupport support)
{
    switch (support) {
    case FastSwapSupport::NotSupported: return "Not supported";
    case FastSwapSupport::DefaultUsb: return "0.5A @ 5V";
    case FastSwapSupport::Current1A5: return "1.5A @ 5V";
    case FastSwapSupport::Current3A0: return "3.0A @ 5V";
    default: return "Unknown";
    }
}

const char* pdoTypeToString(PdoType type)
{
    switch (type) {
    case PdoType::Fixed: return "Fixed";
    case PdoType::Variable: return "Variable";
    case PdoType::Battery: return "Battery";
    case PdoType::Augmented: return "Augmented";
    default: return "Unknown";
    }
}

// Fixed: DRP 29, higher capability 28, unconstrained 27, USB comm 26, DRD 25,
// FRS 24:23, reserved 22:20, voltage 19:10, current 9:0
bool FixedPdo::dualRolePower() const { return getBit(raw_, 29); }
void FixedPdo::setDualRolePower(bool enabled) { raw_ = setBit(raw_, 29, enabled); }
bool FixedPdo::higherCapability() const { return getBit(raw_, 28); }
void FixedPdo::setHigherCapability(bool enabled) { raw_ = setBit(raw_, 28, enabled); }
bool FixedPdo::unconstrainedPower() const { return getBit(raw_, 27); }
void FixedPdo::setUnconstrainedPower(bool enabled) { raw_ = setBit(raw_, 27, enabled); }
bool FixedPdo::usbCommunicationsCapable() const { return getBit(raw_, 26); }
void FixedPdo::setUsbCommunicationsCapable(bool enabled) { raw_ = setBit(raw_, 26, enabled); }
bool FixedPdo::dualRoleData() const { return getBit(raw_, 25); }
void FixedPdo::setDualRoleData(bool enabled) { raw_ = setBit(raw_, 25, enabled); }

FastSwapSupport FixedPdo::fastRoleSwap() const
{
    return fastSwapFromBits(getField(raw_, 23, 0x3));
}

void FixedPdo::setFastRoleSwap(FastSwapSupport support)
{
    raw_ = setField(raw_, 23, 0x3, fastSwapToBits(support));
}

uint16_t FixedPdo::voltage() const { return getField(raw_, 10, FIELD_10BIT); }
void FixedPdo::setVoltage(uint16_t voltage) { raw_ = setField(raw_, 10, FIELD_10BIT, voltage); }
uint16_t FixedPdo::current() const { return getField(raw_, 0, FIELD_10BIT); }
void FixedPdo::setCurrent(uint16_t current) { raw_ = setField(raw_, 0, FIELD_10BIT, current); }

// Variable: max voltage 29:20, min voltage 19:10, current 9:0
uint16_t VariablePdo::maxVoltage() const { return getField(raw_, 20, FIELD_10BIT); }
void VariablePdo::setMaxVoltage(uint16_t voltage) { raw_ = setField(raw_, 20, FIELD_10BIT, voltage); }
uint16_t VariablePdo::minVoltage() const { return getField(raw_, 10, FIELD_10BIT); }
void VariablePdo::setMinVoltage(uint16_t voltage) { raw_ = setField(raw_, 10, FIELD_10BIT, voltage); }
uint16_t VariablePdo::current() const { return getField(raw_, 0, FIELD_10BIT); }
void VariablePdo::setCurrent(uint16_t current) { raw_ = setField(raw_, 0, FIELD_10BIT, current); }

// Battery: max voltage 29:20, min voltage 19:10, power 9:0
uint16_t BatteryPdo::maxVoltage() const { return getField(raw_, 20, FIELD_10BIT); }
void BatteryPdo::setMaxVoltage(uint16_t voltage) { raw_ = setField(raw_, 20, FIELD_10BIT, voltage); }
uint16_t BatteryPdo::minVoltage() const { return getField(raw_, 10, FIELD_10BIT); }
void BatteryPdo::setMinVoltage(uint16_t voltage) { raw_ = setField(raw_, 10, FIELD_10BIT, voltage); }
uint16_t BatteryPdo::power() const { return getField(raw_, 0, FIELD_10BIT); }
void BatteryPdo::setPower(uint16_t power) { raw_ = setField(raw_, 0, FIELD_10BIT, power); }

// APDO: type 29:28, max voltage 24:17, min voltage 15:8, max current 6:0
uint8_t AugmentedPdo::programmableDevice() const { return getField(raw_, 28, 0x3); }
uint16_t AugmentedPdo::maxVoltage() const { return getField(raw_, 17, 0xFF); }
void AugmentedPdo::setMaxVoltage(uint16_t voltage) { raw_ = setField(raw_, 17, 0xFF, voltage); }
uint16_t AugmentedPdo::minVoltage() const { return getField(raw_, 8, 0xFF); }
void AugmentedPdo::setMinVoltage(uint16_t voltage) { raw_ = setField(raw_, 8, 0xFF, voltage); }
uint16_t AugmentedPdo::maxCurrent() const { return getField(raw_, 0, 0x7F); }
void AugmentedPdo::setMaxCurrent(uint16_t current) { raw_ = setField(raw_, 0, 0x7F, current); }

Pdo Pdo::fromBits(uint32_t raw)
{
    return Pdo(raw);
}

Pdo Pdo::fixed(uint16_t voltage, uint16_t current)
{
    FixedPdo fixed_pdo;
    fixed_pdo.setVoltage(voltage);
    fixed_pdo.setCurrent(current);
    return Pdo(fixed_pdo.bits());
}

esp_err_t Pdo::fixedFromUnits(uint32_t voltage_mv, uint32_t current_ma, Pdo* pdo)
{
    if (pdo == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    uint32_t voltage_raw = (voltage_mv + STUSB4500_PDO_VOLTAGE_LSB_MV / 2) / STUSB4500_PDO_VOLTAGE_LSB_MV;
    uint32_t current_raw = (current_ma + STUSB4500_PDO_CURRENT_LSB_MA / 2) / STUSB4500_PDO_CURRENT_LSB_MA;

    if (voltage_raw > FIELD_10BIT || current_raw > FIELD_10BIT) {
        ESP_LOGE(TAG, "Fixed PDO out of range: %lu mV, %lu mA",
            (unsigned long)voltage_mv, (unsigned long)current_ma);
        return ESP_ERR_INVALID_ARG;
    }

    *pdo = fixed((uint16_t)voltage_raw, (uint16_t)current_raw);
    return ESP_OK;
}

esp_err_t Pdo::asFixed(FixedPdo* pdo) const
{
    if (pdo == nullptr) return ESP_ERR_INVALID_ARG;
    if (type() != PdoType::Fixed) return ESP_ERR_INVALID_STATE;
    *pdo = FixedPdo(raw_);
    return ESP_OK;
}

esp_err_t Pdo::asVariable(VariablePdo* pdo) const
{
    if (pdo == nullptr) return ESP_ERR_INVALID_ARG;
    if (type() != PdoType::Variable) return ESP_ERR_INVALID_STATE;
    *pdo = VariablePdo(raw_);
    return ESP_OK;
}

esp_err_t Pdo::asBattery(BatteryPdo* pdo) const
{
    if (pdo == nullptr) return ESP_ERR_INVALID_ARG;
    if (type() != PdoType::Battery) return ESP_ERR_INVALID_STATE;
    *pdo = BatteryPdo(raw_);
    return ESP_OK;
}

esp_err_t Pdo::asAugmented(AugmentedPdo* pdo) const
{
    if (pdo == nullptr) return ESP_ERR_INVALID_ARG;
    if (type() != PdoType::Augmented) return ESP_ERR_INVALID_STATE;
    *pdo = AugmentedPdo(raw_);
    return ESP_OK;
}

template <typename Setter>
esp_err_t Pdo::updateFixed(Setter setter)
{
    if (type() != PdoType::Fixed) {
        ESP_LOGW(TAG, "Fixed PDO field set on %s PDO 0x%08lX", pdoTypeToString(type()), (unsigned long)raw_);
        return ESP_ERR_INVALID_STATE;
    }

    FixedPdo fixed_pdo(raw_);
    setter(fixed_pdo);
    raw_ = fixed_pdo.bits();
    return ESP_OK;
}

esp_err_t Pdo::setDualRolePower(bool enabled)
{
    return updateFixed([enabled](FixedPdo& p) { p.setDualRolePower(enabled); });
}

esp_err_t Pdo::setDualRoleData(bool enabled)
{
    return updateFixed([enabled](FixedPdo& p) { p.setDualRoleData(enabled); });
}

esp_err_t Pdo::setUsbCommunicationsCapable(bool enabled)
{
    return updateFixed([enabled](FixedPdo& p) { p.setUsbCommunicationsCapable(enabled); });
}

esp_err_t Pdo::setHigherCapability(bool enabled)
{
    return updateFixed([enabled](FixedPdo& p) { p.setHigherCapability(enabled); });
}

esp_err_t Pdo::setUnconstrainedPower(bool enabled)
{
    return updateFixed([enabled](FixedPdo& p) { p.setUnconstrainedPower(enabled); });
}
