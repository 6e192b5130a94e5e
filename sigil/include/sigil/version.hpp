#pragma once

#define SIGIL_VERSION "0.4.0"
#define SIGIL_SNAPSHOT_FORMAT 1

namespace sigil {
namespace version {

// Snapshots without a "format" field predate versioning and read as format 1
inline bool snapshot_compatible(int format) {
    return format >= 1 && format <= SIGIL_SNAPSHOT_FORMAT;
}

} // namespace version
} // namespace sigil
