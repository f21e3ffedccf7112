#include "stusb4500_rdo.h"

// Object position 30:28, give back 27, capability mismatch 26, USB comm 25,
// no USB suspend 24, unchunked ext. messages 23, operating current 19:10,
// max operating current 9:0

uint8_t Rdo::position() const
{
    return (raw_ >> 28) & 0x07;
}

bool Rdo::giveBack() const
{
    return (raw_ >> 27) & 0x1;
}

bool Rdo::capabilityMismatch() const
{
    return (raw_ >> 26) & 0x1;
}

bool Rdo::usbCommunicationCapable() const
{
    return (raw_ >> 25) & 0x1;
}

bool Rdo::noUsbSuspend() const
{
    return (raw_ >> 24) & 0x1;
}

bool Rdo::unchunkedExtendedMessages() const
{
    return (raw_ >> 23) & 0x1;
}

uint16_t Rdo::operatingCurrent() const
{
    return (raw_ >> 10) & 0x3FF;
}

uint16_t Rdo::maxOperatingCurrent() const
{
    return raw_ & 0x3FF;
}
