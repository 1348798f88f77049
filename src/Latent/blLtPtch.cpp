// Created by Unium on 08.03.26

#include "blLtPtch.hpp"
#include "../Tensor/mtTnOps_.hpp"
#include "../Tokenizer/tkTkByte.hpp"
#include <algorithm>
#include <cmath>

using namespace MT;

namespace BL {

auto bValidBoundaries(const std::vector<int64_t> &vlBounds, int64_t lLen) -> bool {
    if (vlBounds.empty() || vlBounds.front() != 0 || vlBounds.back() != lLen)
        return false;
    for (size_t i = 1; i < vlBounds.size(); i++) {
        if (vlBounds[i] <= vlBounds[i - 1])
            return false;
    }
    return true;
}

// <<<s_start(entropy)
// --- entropy
auto vfHistogramEntropy(const std::vector<int32_t> &viIds, int32_t iWindow) -> std::vector<float> {
    const int64_t lLen = (int64_t)viIds.size();
    std::vector<float> vfOut(lLen, 0.0f);
    std::vector<int32_t> viCount(TK::kByteVocab, 0);

    for (int64_t i = 0; i < lLen; i++) {
        viCount[viIds[i]]++;
        if (i >= iWindow)
            viCount[viIds[i - iWindow]]--;

        const int64_t lInWindow = std::min<int64_t>(i + 1, iWindow);
        const double dInv = 1.0 / (double)lInWindow;

        double dEnt = 0.0;
        for (int32_t iCount : viCount) {
            if (iCount <= 0)
                continue;
            double dP = iCount * dInv;
            dEnt -= dP * std::log2(dP);
        }
        vfOut[i] = (float)dEnt;
    }
    return vfOut;
}

auto CEntropyPatcher::bInit(const SPatcherConfig &sCfg, const CTensor *ptHead, UT::SError &sErr) -> bool {
    m_bReady = false;
    if (!bValidatePatcherConfig(sCfg, sErr))
        return false;

    if (sCfg.eEntropy == EEntropyMode::Predictor) {
        if (ptHead == nullptr || ptHead->bEmpty())
            return UT::bFail(sErr, UT::EError::Configuration, "entropy_mode predictor needs an entropy head");
        if (ptHead->m_iNdim != 2 || ptHead->m_lShape[0] != TK::kByteVocab)
            return UT::bFail(sErr, UT::EError::Configuration,
                             "entropy head must be [259, local_dim], got " + ptHead->szShape());
    }

    m_sCfg = sCfg;
    m_ptHead = ptHead;
    m_bReady = true;
    return true;
}

auto CEntropyPatcher::bEntropy(const std::vector<int32_t> &viIds, const CTensor &tReps, std::vector<float> &vfOut,
                               UT::SError &sErr) const -> bool {
    if (!m_bReady)
        return UT::bFail(sErr, UT::EError::Internal, "entropy patcher used before bInit");

    const int64_t lLen = (int64_t)viIds.size();
    for (int64_t i = 0; i < lLen; i++) {
        if (viIds[i] < 0 || viIds[i] >= TK::kByteVocab)
            return UT::bFail(sErr, UT::EError::Encoding,
                             "id " + std::to_string(viIds[i]) + " at position " + std::to_string(i) +
                                 " outside the byte vocabulary");
    }

    if (m_sCfg.eEntropy == EEntropyMode::Histogram) {
        vfOut = vfHistogramEntropy(viIds, m_sCfg.iWindow);
        return true;
    }

    vfOut.assign(lLen, 0.0f);
    if (lLen == 0)
        return true;
    if (tReps.bEmpty() || tReps.lRows() != lLen || tReps.lCols() != m_ptHead->lCols())
        return UT::bFail(sErr, UT::EError::Internal,
                         "predictor entropy got representations " + tReps.szShape() + " for " +
                             std::to_string(lLen) + " ids");

    // nothing precedes position 0, score it as a uniform guess
    vfOut[0] = std::log2((float)TK::kByteVocab);
    if (lLen == 1)
        return true;

    // row r predicts id r + 1
    CTensor tPrev = OP::SliceRange(tReps, 0, lLen - 1);
    CTensor tProbs = OP::Linear(tPrev, *m_ptHead);
    OP::SoftmaxRowsInplace(tProbs);
    if (!OP::bAllFinite(tProbs))
        return UT::bFail(sErr, UT::EError::Numerical, "entropy head produced non-finite probabilities");

    for (int64_t i = 1; i < lLen; i++) {
        float fP = tProbs.pfRow(i - 1)[viIds[i]];
        vfOut[i] = -std::log2(std::max(fP, 1e-30f));
    }
    return true;
}
// >>>s_end(entropy)

// <<<s_start(boundaries)
// --- boundary rule
auto CEntropyPatcher::vlBoundaries(const std::vector<float> &vfEntropy, std::vector<float> *pvfThreshold) const
    -> std::vector<int64_t> {
    const int64_t lLen = (int64_t)vfEntropy.size();
    std::vector<int64_t> vlOut = {0};
    if (pvfThreshold)
        pvfThreshold->assign(lLen, 0.0f);

    const bool bAdaptive = m_sCfg.eThreshold == EThresholdMode::Adaptive;
    float fThr = m_sCfg.fThreshold;
    if (bAdaptive)
        fThr = std::min(std::max(fThr, m_sCfg.fMinThreshold), m_sCfg.fMaxThreshold);

    int64_t lStart = 0;
    for (int64_t i = 0; i < lLen; i++) {
        if (pvfThreshold)
            (*pvfThreshold)[i] = fThr;

        // position 0 always opens the first patch but still moves the threshold
        const int64_t lCur = i - lStart;
        bool bCut = i > 0 && (lCur >= m_sCfg.iMaxPatch || (vfEntropy[i] > fThr && lCur >= m_sCfg.iMinPatch));
        if (bCut) {
            vlOut.push_back(i);
            lStart = i;
        }

        if (bAdaptive) {
            fThr = bCut ? std::min(fThr + m_sCfg.fStepUp, m_sCfg.fMaxThreshold)
                        : std::max(fThr - m_sCfg.fStepDown, m_sCfg.fMinThreshold);
        }
    }

    if (lLen > 0)
        vlOut.push_back(lLen);
    return vlOut;
}
// >>>s_end(boundaries)

auto CEntropyPatcher::bSegment(const std::vector<int32_t> &viIds, const CTensor &tReps, std::vector<int64_t> &vlOut,
                               UT::SError &sErr) const -> bool {
    std::vector<float> vfEnt;
    if (!bEntropy(viIds, tReps, vfEnt, sErr))
        return false;
    vlOut = vlBoundaries(vfEnt);
    return true;
}
} // namespace BL
