#pragma once

// Project-wide constants for hamcall

namespace HamCall {

// ADIF identifier for "no DXCC" (maritime/aeronautical mobile, satellite).
// Not part of the entity list.
static constexpr int ADIF_NO_DXCC = 0;

// Sentinel entity names used by prefix and exception records instead of a
// real entity
static constexpr const char *ENTITY_MARITIME_MOBILE = "MARITIME MOBILE";
static constexpr const char *ENTITY_AERONAUTICAL_MOBILE = "AERONAUTICAL MOBILE";
static constexpr const char *ENTITY_SATELLITE =
    "SATELLITE, INTERNET OR REPEATER";

// Appendices that never count as a prefix unless they are the first part of
// the callsign. "MM" alone is Scotland, "W1AW/MM" is maritime mobile.
static constexpr const char *RESERVED_APPENDICES[] = {"AM", "MM", "SAT", "P",
                                                      "M",  "QRP", "LH"};

// Appendices that detach a callsign from any entity
static constexpr const char *APPENDIX_AERONAUTICAL_MOBILE = "AM";
static constexpr const char *APPENDIX_MARITIME_MOBILE = "MM";
static constexpr const char *APPENDIX_SATELLITE = "SAT";

// Config file name inside the config directory
static constexpr const char *CONFIG_FILE_NAME = "hamcall.json";

// Log file name inside the log directory
static constexpr const char *LOG_FILE_NAME = "hamcall.log";

} // namespace HamCall
