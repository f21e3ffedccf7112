#pragma once

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// Device identification
#define STUSB4500_REG_DEVICE_ID                 0x2F
#define STUSB4500_EVAL_DEVICE_ID                0x21
#define STUSB4500_PROD_DEVICE_ID                0x25

// 7-bit I2C addresses selected by the ADDR0/ADDR1 pins
#define STUSB4500_I2C_ADDR_DEFAULT              0x28
#define STUSB4500_I2C_ADDR_ADDR0                0x29
#define STUSB4500_I2C_ADDR_ADDR1                0x2A
#define STUSB4500_I2C_ADDR_ADDR0_ADDR1          0x2B

// Status registers
#define STUSB4500_REG_ALERT_STATUS_1            0x0B
#define STUSB4500_REG_CC_STATUS                 0x11
#define STUSB4500_REG_PD_TYPEC_STATUS           0x14
#define STUSB4500_REG_PRT_STATUS                0x16
#define STUSB4500_REG_PE_FSM                    0x29

// VBUS monitoring
#define STUSB4500_REG_VBUS_VOLTAGE_LOW          0x26
#define STUSB4500_VBUS_VOLTAGE_MASK             0x03FF
#define STUSB4500_VBUS_LSB_MV                   25

// Soft reset
#define STUSB4500_REG_TX_HEADER_LOW             0x51
#define STUSB4500_REG_PD_COMMAND_CTRL           0x1A
#define STUSB4500_TX_HEADER_SOFT_RESET          0x0D
#define STUSB4500_PD_COMMAND_SEND               0x26

// Sink PDO registers, 4 bytes each, little endian
#define STUSB4500_REG_DPM_PDO_NUMB              0x70
#define STUSB4500_REG_DPM_SNK_PDO1_0            0x85
#define STUSB4500_REG_DPM_SNK_PDO2_0            0x89
#define STUSB4500_REG_DPM_SNK_PDO3_0            0x8D
#define STUSB4500_DPM_PDO_NUMB_MASK             0x07
#define STUSB4500_PDO_CHANNEL_COUNT             3

// Negotiated request data object, 4 bytes, little endian
#define STUSB4500_REG_RDO_REG_STATUS            0x91

// NVM (FTP) programming registers
#define STUSB4500_REG_FTP_CUST_PASSWORD_REG     0x95
#define STUSB4500_FTP_CUST_PASSWORD             0x47
#define STUSB4500_REG_FTP_CTRL_0                0x96
#define STUSB4500_REG_FTP_CTRL_1                0x97
#define STUSB4500_REG_RW_BUFFER                 0x53

// FTP_CTRL_0 bits
#define STUSB4500_FTP_CUST_PWR                  0x80
#define STUSB4500_FTP_CUST_RST_N                0x40
#define STUSB4500_FTP_CUST_REQ                  0x10
#define STUSB4500_FTP_CUST_SECT                 0x07

// FTP_CTRL_1 fields
#define STUSB4500_FTP_CUST_SER                  0xF8
#define STUSB4500_FTP_CUST_SER_SHIFT            3
#define STUSB4500_FTP_CUST_OPCODE               0x07

// NVM geometry
#define STUSB4500_NVM_SECTOR_COUNT              5
#define STUSB4500_NVM_SECTOR_SIZE               8
#define STUSB4500_NVM_IMAGE_SIZE                (STUSB4500_NVM_SECTOR_COUNT * STUSB4500_NVM_SECTOR_SIZE)

// PDO/RDO field units
#define STUSB4500_PDO_VOLTAGE_LSB_MV            50
#define STUSB4500_PDO_CURRENT_LSB_MA            10
#define STUSB4500_PDO_POWER_LSB_MW              250
#define STUSB4500_APDO_VOLTAGE_LSB_MV           100
#define STUSB4500_APDO_CURRENT_LSB_MA           50

// CC status register bits
#define STUSB4500_CC_STATUS_CC1_STATE_MASK      0x03
#define STUSB4500_CC_STATUS_CC2_STATE_MASK      0x0C
#define STUSB4500_CC_STATUS_CC2_STATE_SHIFT     2
#define STUSB4500_CC_STATUS_CONNECT_RESULT      0x10
#define STUSB4500_CC_STATUS_LOOKING4CONNECTION  0x20

// PD/Type-C status register bits
#define STUSB4500_PD_TYPEC_STATUS_PD_TYPEC_HAND_CHECK    0x80
#define STUSB4500_PD_TYPEC_STATUS_TYPEC_FSM_STATE_MASK   0x1F

// PRT status register bits
#define STUSB4500_PRT_STATUS_HWRESET_RECEIVED   0x01
#define STUSB4500_PRT_STATUS_SOFTRESET_RECEIVED 0x02
#define STUSB4500_PRT_STATUS_DATAROLE           0x04
#define STUSB4500_PRT_STATUS_POWERROLE          0x08
#define STUSB4500_PRT_STATUS_PD_CONTRACT        0x10
#define STUSB4500_PRT_STATUS_STARTUP_POWER      0x20
#define STUSB4500_PRT_STATUS_MSG_RECEIVED       0x40
#define STUSB4500_PRT_STATUS_MSG_SENT           0x80

    typedef enum {
        STUSB4500_CC_STATE_NOT_IN_UFP = 0,
        STUSB4500_CC_STATE_DEFAULT_USB = 1,
        STUSB4500_CC_STATE_POWER_1_5A = 2,
        STUSB4500_CC_STATE_POWER_3_0A = 3
    } stusb4500_cc_state_t;

    typedef enum {
        STUSB4500_TYPEC_FSM_UNATTACHED_SNK = 0,
        STUSB4500_TYPEC_FSM_ATTACH_WAIT_SNK = 1,
        STUSB4500_TYPEC_FSM_ATTACHED_SNK = 2,
        STUSB4500_TYPEC_FSM_DEBUG_ACCESSORY_SNK = 3
    } stusb4500_typec_fsm_state_t;

    typedef enum {
        STUSB4500_PDO_CHANNEL_1 = 1,
        STUSB4500_PDO_CHANNEL_2 = 2,
        STUSB4500_PDO_CHANNEL_3 = 3
    } stusb4500_pdo_channel_t;

    typedef struct {
        stusb4500_cc_state_t cc1_state;
        stusb4500_cc_state_t cc2_state;
        bool connection_result;
        bool looking_for_connection;
    } stusb4500_cc_status_t;

    typedef struct {
        bool pd_typec_handshake_check;
        stusb4500_typec_fsm_state_t fsm_state;
    } stusb4500_pd_typec_status_t;

    typedef struct {
        bool hw_reset_received;
        bool soft_reset_received;
        bool data_role_sink;        // true = sink, false = source
        bool power_role_sink;       // true = sink, false = source
        bool pd_contract_active;
        bool startup_power;
        bool message_received;
        bool message_sent;
    } stusb4500_prt_status_t;

    typedef struct {
        uint8_t device_id;
        stusb4500_cc_status_t cc_status;
        stusb4500_pd_typec_status_t pd_typec_status;
        stusb4500_prt_status_t prt_status;
        uint8_t pe_fsm_state;
        bool is_connected;
        bool pd_negotiation_complete;
    } stusb4500_negotiation_status_t;

#ifdef __cplusplus
}
#endif
