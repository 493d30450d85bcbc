// Copyright (c) 2023, Adam Simpkins
#pragma once

/*
 * Build-time configuration for usbpad.
 *
 * All of these settings may be overridden by the build system by defining
 * the macro on the compiler command line.
 */

// Select the hardware backend.  If USBPAD_CONFIG_HW_MULTI is set, HWDevice
// is a virtual interface and the backend is chosen at runtime.
#ifndef USBPAD_CONFIG_HW_MULTI
#define USBPAD_CONFIG_HW_MULTI 0
#endif
#ifndef USBPAD_CONFIG_HW_MOCK
#define USBPAD_CONFIG_HW_MOCK 0
#endif

// The endpoint number is encoded as 4 bits in USB token packets, so up to 16
// IN and 16 OUT endpoints are possible (including endpoint 0).  Most device
// hardware supports far fewer than this.
#ifndef USBPAD_CONFIG_MAX_IN_ENDPOINTS
#define USBPAD_CONFIG_MAX_IN_ENDPOINTS 6
#endif
#ifndef USBPAD_CONFIG_MAX_OUT_ENDPOINTS
#define USBPAD_CONFIG_MAX_OUT_ENDPOINTS 6
#endif
#ifndef USBPAD_CONFIG_MAX_INTERFACES
#define USBPAD_CONFIG_MAX_INTERFACES 6
#endif

// Number of hardware events that can be buffered between the interrupt
// handler and the USB task.
#ifndef USBPAD_CONFIG_EVENT_QUEUE_SIZE
#define USBPAD_CONFIG_EVENT_QUEUE_SIZE 16
#endif

// Minimum level of log messages that are compiled in.
// 10 = verbose, 20 = debug, 30 = info, 40 = warning, 50 = error
#ifndef USBPAD_CONFIG_LOG_LEVEL
#define USBPAD_CONFIG_LOG_LEVEL 0
#endif
