#pragma once

#include <cstddef>
#include <string>

namespace geopat {

enum class AlgorithmKind {
    Sia,
    SiaR,
    Siatec,
    SiatecC,
    SiatecCH
};

/// Optional covering pass applied on top of the TEC algorithm.
enum class Covering {
    None,
    Cosiatec,
    SiatecCompress
};

/// Selects and parameterizes a discovery algorithm.
struct AlgorithmConfig {
    AlgorithmKind kind = AlgorithmKind::Siatec;
    size_t r = 3;                   // SIAR sub-diagonals
    bool remove_duplicates = true;  // SIATEC
    double max_ioi = 10.0;          // SIATEC-C, SIATEC-CH
    Covering covering = Covering::None;

    /// Throws std::invalid_argument for parameters the selected algorithm
    /// cannot run with.
    void validate() const;

    /// True for SIA and SIAR.
    bool producesMtps() const;

    /// Algorithm name with its parameters, e.g. "SIAR (r=3)".
    std::string describe() const;
};

/// Case-insensitive: SIA, SIAR, SIATEC, SIATEC-C, SIATEC-CH.
AlgorithmKind parseAlgorithmKind(const std::string& name);
std::string algorithmName(AlgorithmKind kind);

/// Case-insensitive: NONE, COSIATEC, SIATECCOMPRESS.
Covering parseCovering(const std::string& name);
std::string coveringName(Covering covering);

} // namespace geopat
