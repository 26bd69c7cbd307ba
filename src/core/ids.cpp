#include "pathgate/core/ids.h"

#include <Poco/UUIDGenerator.h>

namespace pathgate::core {

std::string GenerateRequestId() {
    return Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
}

std::string GenerateTempName(const std::string& stem) {
    return "." + stem + ".pathgate-" +
           Poco::UUIDGenerator::defaultGenerator().createRandom().toString() + ".tmp";
}

}  // namespace pathgate::core
