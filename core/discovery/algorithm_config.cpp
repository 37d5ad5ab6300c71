#include "discovery/algorithm_config.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace geopat {

namespace {

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

void AlgorithmConfig::validate() const {
    switch (kind) {
        case AlgorithmKind::SiaR:
            if (r == 0) throw std::invalid_argument("SIAR requires r > 0");
            break;
        case AlgorithmKind::SiatecC:
        case AlgorithmKind::SiatecCH:
            if (!std::isfinite(max_ioi) || max_ioi <= 0.0) {
                throw std::invalid_argument(algorithmName(kind) +
                                            " requires a positive finite max_ioi");
            }
            break;
        default:
            break;
    }
}

bool AlgorithmConfig::producesMtps() const {
    return kind == AlgorithmKind::Sia || kind == AlgorithmKind::SiaR;
}

std::string AlgorithmConfig::describe() const {
    std::ostringstream oss;
    oss << algorithmName(kind);
    switch (kind) {
        case AlgorithmKind::SiaR:
            oss << " (r=" << r << ")";
            break;
        case AlgorithmKind::SiatecC:
        case AlgorithmKind::SiatecCH:
            oss << " (max-ioi=" << max_ioi << ")";
            break;
        default:
            break;
    }
    if (covering != Covering::None) {
        oss << " + " << coveringName(covering);
    }
    return oss.str();
}

AlgorithmKind parseAlgorithmKind(const std::string& name) {
    const std::string upper = toUpper(name);
    if (upper == "SIA") return AlgorithmKind::Sia;
    if (upper == "SIAR") return AlgorithmKind::SiaR;
    if (upper == "SIATEC") return AlgorithmKind::Siatec;
    if (upper == "SIATEC-C") return AlgorithmKind::SiatecC;
    if (upper == "SIATEC-CH") return AlgorithmKind::SiatecCH;

    logger()->error("Unknown algorithm '{}'", name);
    throw std::invalid_argument("Unknown algorithm '" + name +
                                "', expected one of SIA, SIAR, SIATEC, SIATEC-C, SIATEC-CH");
}

std::string algorithmName(AlgorithmKind kind) {
    switch (kind) {
        case AlgorithmKind::Sia:      return "SIA";
        case AlgorithmKind::SiaR:     return "SIAR";
        case AlgorithmKind::Siatec:   return "SIATEC";
        case AlgorithmKind::SiatecC:  return "SIATEC-C";
        case AlgorithmKind::SiatecCH: return "SIATEC-CH";
    }
    return "UNKNOWN";
}

Covering parseCovering(const std::string& name) {
    const std::string upper = toUpper(name);
    if (upper == "NONE") return Covering::None;
    if (upper == "COSIATEC") return Covering::Cosiatec;
    if (upper == "SIATECCOMPRESS") return Covering::SiatecCompress;

    logger()->error("Unknown covering '{}'", name);
    throw std::invalid_argument("Unknown covering '" + name +
                                "', expected one of NONE, COSIATEC, SIATECCOMPRESS");
}

std::string coveringName(Covering covering) {
    switch (covering) {
        case Covering::None:           return "NONE";
        case Covering::Cosiatec:       return "COSIATEC";
        case Covering::SiatecCompress: return "SIATECCompress";
    }
    return "UNKNOWN";
}

} // namespace geopat
