// Copyright (c) 2023, Adam Simpkins
#pragma once

/*
 * This file defines the HWDevice class.
 *
 * If only one hardware type is supported, HWDevice is an alias for that
 * specific hardware device class, and no dynamic dispatch is needed at
 * runtime.  If USBPAD_CONFIG_HW_MULTI is enabled, HWDevice is a pure virtual
 * base class, and several devices with different hardware types may be used
 * together in the same program.
 */

#include "usbpad/hw/HWDeviceBase.h"

#if USBPAD_CONFIG_HW_MULTI

namespace usbpad { using HWDevice = HWDeviceBase; }

#else // !USBPAD_CONFIG_HW_MULTI

#if USBPAD_CONFIG_HW_MOCK
#include "usbpad/hw/mock/MockDevice.h"
namespace usbpad { using HWDevice = MockDevice; }
#else
#error "No hardware implementation selected!"
#endif

#endif // !USBPAD_CONFIG_HW_MULTI
