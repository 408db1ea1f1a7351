// version.cpp - Version reporting
#include "version.h"

namespace sandcell::protocol {

std::string GetVersionString() {
    return std::to_string(kVersionMajor) + "." + std::to_string(kVersionMinor) + "." +
           std::to_string(kVersionPatch) + "-" + kVersionBuild;
}

void FillVersion(Version* version) {
    version->set_major(kVersionMajor);
    version->set_minor(kVersionMinor);
    version->set_patch(kVersionPatch);
    version->set_build(kVersionBuild);
}

} // namespace sandcell::protocol
