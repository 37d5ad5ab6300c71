#pragma once

#include "discovery/algorithm.hpp"
#include "discovery/algorithm_config.hpp"
#include "discovery/cosiatec.hpp"
#include "discovery/sia.hpp"
#include "discovery/siar.hpp"
#include "discovery/siatec.hpp"
#include "discovery/siatec_c.hpp"
#include "discovery/siatec_compress.hpp"

#include <memory>
#include <stdexcept>

namespace geopat {

// ─── MtpAsTec ──────────────────────────────────────────────────
// Runs an MTP algorithm behind the TEC interface: every MTP becomes a TEC
// with its single translator.

template <typename P>
class MtpAsTec : public TecAlgorithm<P> {
public:
    explicit MtpAsTec(std::unique_ptr<MtpAlgorithm<P>> mtp_algorithm)
        : mtp_algorithm_(std::move(mtp_algorithm)) {
        if (!mtp_algorithm_) throw std::invalid_argument("MtpAsTec needs an MTP algorithm");
    }

    std::string name() const override { return mtp_algorithm_->name(); }

    void computeTecsToOutput(const PointSet<P>& point_set,
                             const TecSink<P>& on_output) const override {
        mtp_algorithm_->computeMtpsToOutput(point_set, [&](Mtp<P> mtp) {
            std::vector<P> translators;
            if (!mtp.translator.isZero()) translators.push_back(mtp.translator);
            on_output(Tec<P>(std::move(mtp.pattern), std::move(translators)));
        });
    }

private:
    std::unique_ptr<MtpAlgorithm<P>> mtp_algorithm_;
};

/// SIA or SIAR as configured. Throws std::invalid_argument for the
/// TEC-only kinds and for invalid parameters.
template <typename P>
std::unique_ptr<MtpAlgorithm<P>> makeMtpAlgorithm(const AlgorithmConfig& config) {
    config.validate();
    switch (config.kind) {
        case AlgorithmKind::Sia:
            return std::make_unique<Sia<P>>();
        case AlgorithmKind::SiaR:
            return std::make_unique<SiaR<P>>(config.r);
        default:
            throw std::invalid_argument(algorithmName(config.kind) + " is not an MTP algorithm");
    }
}

/// Any configured algorithm behind the TEC interface, wrapped in the
/// configured covering pass.
template <typename P>
std::unique_ptr<TecAlgorithm<P>> makeTecAlgorithm(const AlgorithmConfig& config) {
    config.validate();

    std::unique_ptr<TecAlgorithm<P>> algorithm;
    switch (config.kind) {
        case AlgorithmKind::Sia:
        case AlgorithmKind::SiaR:
            algorithm = std::make_unique<MtpAsTec<P>>(makeMtpAlgorithm<P>(config));
            break;
        case AlgorithmKind::Siatec:
            algorithm = std::make_unique<Siatec<P>>(config.remove_duplicates);
            break;
        case AlgorithmKind::SiatecC:
            algorithm = std::make_unique<SiatecC<P>>(config.max_ioi);
            break;
        case AlgorithmKind::SiatecCH:
            algorithm = std::make_unique<SiatecCH<P>>(config.max_ioi);
            break;
    }

    switch (config.covering) {
        case Covering::Cosiatec:
            return std::make_unique<Cosiatec<P>>(std::move(algorithm));
        case Covering::SiatecCompress:
            return std::make_unique<SiatecCompress<P>>(std::move(algorithm));
        case Covering::None:
            break;
    }
    return algorithm;
}

} // namespace geopat
