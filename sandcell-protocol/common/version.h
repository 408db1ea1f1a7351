// version.h - Build version reported by the daemon and by GetStatus
#pragma once

#include <string>
#include "sandbox.pb.h"

namespace sandcell::protocol {

constexpr int kVersionMajor = 0;
constexpr int kVersionMinor = 3;
constexpr int kVersionPatch = 0;
constexpr const char* kVersionBuild = "beta";

// "0.3.0-beta"
std::string GetVersionString();

void FillVersion(Version* version);

} // namespace sandcell::protocol
