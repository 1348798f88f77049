// Created by Unium on 08.03.26

#pragma once

#include "../Tensor/mtTnTnsr.hpp"
#include "../Util/utUtErr_.hpp"
#include "blLtConf.hpp"
#include <cstdint>
#include <vector>

namespace BL {
/*---------------------------------------------------------
 * FN: bValidBoundaries
 * DESC: true if vlBounds is strictly increasing, starts at 0
 *       and ends at lLen. [0] is the valid list for lLen = 0
 * PARMS: vlBounds (boundary offsets), lLen (sequence length)
 * AUTH: unium (08.03.26)
 *-------------------------------------------------------*/
auto bValidBoundaries(const std::vector<int64_t> &vlBounds, int64_t lLen) -> bool;

/*---------------------------------------------------------
 * FN: vfHistogramEntropy
 * DESC: shannon entropy in bits of the id histogram over the
 *       window [i - iWindow + 1, i], for every position i
 * PARMS: viIds (ids), iWindow (>= 1)
 * AUTH: unium (08.03.26)
 *-------------------------------------------------------*/
auto vfHistogramEntropy(const std::vector<int32_t> &viIds, int32_t iWindow) -> std::vector<float>;

/*---------------------------------------------------------
 * FN: CEntropyPatcher
 * DESC: scores every byte position and cuts the stream into
 *       patches. a position opens a new patch when the current
 *       one is full, or when its entropy clears the threshold
 *       and the current one has reached the minimum size
 * AUTH: unium (08.03.26)
 *-------------------------------------------------------*/
class CEntropyPatcher {
public:
    /*---------------------------------------------------------
     * FN: bInit
     * DESC: checks and stores the config. predictor mode needs
     *       the next byte head [259, local_dim], it stays owned by
     *       the caller
     * PARMS: sCfg (patcher config), ptHead (head or nullptr),
     *        sErr (status)
     * AUTH: unium (08.03.26)
     *-------------------------------------------------------*/
    auto bInit(const SPatcherConfig &sCfg, const MT::CTensor *ptHead, UT::SError &sErr) -> bool;

    /*---------------------------------------------------------
     * FN: bEntropy
     * DESC: per position entropy in bits. histogram mode only
     *       reads the ids, predictor mode scores id i with the
     *       head applied to representation i - 1 (surprisal)
     * PARMS: viIds (ids), tReps (local encoder output [L, d],
     *        unused in histogram mode), vfOut, sErr
     * AUTH: unium (08.03.26)
     *-------------------------------------------------------*/
    auto bEntropy(const std::vector<int32_t> &viIds, const MT::CTensor &tReps, std::vector<float> &vfOut,
                  UT::SError &sErr) const -> bool;

    /*---------------------------------------------------------
     * FN: vlBoundaries
     * DESC: applies the boundary rule over the entropy trace.
     *       pvfThreshold, if given, receives the threshold used
     *       at every position (for the adaptive mode)
     * PARMS: vfEntropy (per position bits), pvfThreshold
     * AUTH: unium (08.03.26)
     *-------------------------------------------------------*/
    auto vlBoundaries(const std::vector<float> &vfEntropy, std::vector<float> *pvfThreshold = nullptr) const
        -> std::vector<int64_t>;

    // bEntropy + vlBoundaries
    auto bSegment(const std::vector<int32_t> &viIds, const MT::CTensor &tReps, std::vector<int64_t> &vlOut,
                  UT::SError &sErr) const -> bool;

    auto sConfig() const -> const SPatcherConfig & { return m_sCfg; }
    auto bReady() const -> bool { return m_bReady; }

private:
    SPatcherConfig m_sCfg;
    const MT::CTensor *m_ptHead = nullptr;
    bool m_bReady = false;
};
} // namespace BL
