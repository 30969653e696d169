#ifndef SHOW_INGEST_CONSTANTS_H
#define SHOW_INGEST_CONSTANTS_H

#include <cstdint>

// Constants shared across ingest components

namespace show_ingest::IngestConstants {

constexpr const char* VERSION = "0.3.0";
constexpr const char* PROGRAM_NAME = "show_ingest";

// Device supervision
constexpr int DEVICE_POLL_INTERVAL_MS = 100;
constexpr int DEGRADED_RESTART_DELAY_MS = 500;

// Supervisor loop tick (signal polling, stats cadence)
constexpr int SUPERVISOR_TICK_MS = 100;

// Worker pop timeout so shutdown is noticed promptly
constexpr int WORKER_POP_TIMEOUT_MS = 200;

// Speex noise suppression level
constexpr int DENOISE_SUPPRESS_DB = -25;

// Source id of the single actor mic
constexpr int PRIMARY_MIC_SOURCE_ID = 0;

}  // namespace show_ingest::IngestConstants

#endif  // SHOW_INGEST_CONSTANTS_H
