#pragma once

/// @file nsdp_library.h
/// Master include for the NSDP library

#include "libnsdp/version.h"
#include "core/types.h"
#include "core/error.h"
#include "core/log.h"
#include "core/hex.h"
#include "packet/message.h"
#include "packet/tlv_ids.h"
#include "transport/transport_factory.h"
#include "session/session.h"
#include "nsdp_device.h"
#include "catalog/param_catalog.h"
#include "catalog/param_decoders.h"
#include "scan/tlv_scanner.h"
#include "scan/value_interpreter.h"
#include "scan/result_aggregator.h"
#include "report/report_writer.h"

namespace libnsdp {

/// Initialize the library (call once at startup)
void initialize();

/// Shutdown and cleanup
void shutdown();

/// Get library version string
const char* versionString();

} // namespace libnsdp
