// Created by Unium on 13.03.26

#include "gnGnLoop.hpp"
#include "../Tensor/mtTnOps_.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

using namespace MT;

namespace GN {

auto szStepResultName(EStepResult eResult) -> const char * {
    switch (eResult) {
    case EStepResult::Continue:
        return "continue";
    case EStepResult::Eos:
        return "eos";
    case EStepResult::MaxNewBytes:
        return "max_new_bytes";
    case EStepResult::MaxSeqLen:
        return "max_seq_len";
    case EStepResult::Error:
        return "error";
    }
    return "?";
}

// <<<s_start(sampler)
// --- sampling
CSampler::CSampler(uint64_t uSeed) { Reseed(uSeed); }

void CSampler::Reseed(uint64_t uSeed) {
    // xorshift never leaves 0
    m_uState = uSeed != 0 ? uSeed : 0x9E3779B97F4A7C15ull;
}

auto CSampler::fRandFloat() -> float {
    m_uState ^= m_uState << 13;
    m_uState ^= m_uState >> 7;
    m_uState ^= m_uState << 17;
    return (float)(m_uState & 0x7FFFFF) / (float)0x800000;
}

auto CSampler::iSample(const float *pfLogits, const std::vector<bool> &vbAllowed, float fTemperature, int32_t iTopK)
    -> int32_t {
    struct SPair {
        int32_t iIdx;
        float fVal;
    };

    std::vector<SPair> vPairs;
    vPairs.reserve(vbAllowed.size());
    for (size_t i = 0; i < vbAllowed.size(); i++) {
        if (vbAllowed[i])
            vPairs.push_back({(int32_t)i, pfLogits[i]});
    }
    if (vPairs.empty())
        return -1;

    // greedy, the pairs are in id order so the first max wins ties
    if (fTemperature < 1e-6f) {
        SPair sBest = vPairs[0];
        for (const auto &p : vPairs) {
            if (p.fVal > sBest.fVal)
                sBest = p;
        }
        return sBest.iIdx;
    }

    for (auto &p : vPairs)
        p.fVal /= fTemperature;

    auto lfnGreater = [](const SPair &a, const SPair &b) {
        return a.fVal > b.fVal || (a.fVal == b.fVal && a.iIdx < b.iIdx);
    };

    // top k
    if (iTopK > 0 && iTopK < (int32_t)vPairs.size()) {
        std::partial_sort(vPairs.begin(), vPairs.begin() + iTopK, vPairs.end(), lfnGreater);
        vPairs.resize(iTopK);
    } else {
        std::sort(vPairs.begin(), vPairs.end(), lfnGreater);
    }

    // softmax
    float fMax = vPairs[0].fVal;
    float fSum = 0.0f;
    for (auto &p : vPairs) {
        p.fVal = std::exp(p.fVal - fMax);
        fSum += p.fVal;
    }

    float fR = fRandFloat() * fSum;
    float fCumul = 0.0f;
    for (const auto &p : vPairs) {
        fCumul += p.fVal;
        if (fR < fCumul)
            return p.iIdx;
    }
    return vPairs.back().iIdx;
}
// >>>s_end(sampler)

// <<<s_start(state)
// --- generation state machine
CGenerationState::CGenerationState(BL::CByteLatentModel &sModel, const SGenConfig &sCfg)
    : m_sModel(sModel), m_sCfg(sCfg), m_cSampler(sCfg.uSeed) {}

auto CGenerationState::bStart(const std::vector<int32_t> &viPrompt, UT::SError &sErr) -> bool {
    if (m_eState != EGenState::Start)
        return UT::bFail(sErr, UT::EError::Internal, "generation already started");
    if (!m_sModel.bBuilt())
        return UT::bFail(sErr, UT::EError::Internal, "generation on a model that was never built");
    if (viPrompt.empty())
        return UT::bFail(sErr, UT::EError::Configuration, "empty prompt, start it with <bos>");
    if (m_sCfg.iMaxNewBytes < 0)
        return UT::bFail(sErr, UT::EError::Configuration, "max_new_bytes must be >= 0");
    if ((int64_t)viPrompt.size() > m_sModel.sConfig().iMaxSeqLen)
        return UT::bFail(sErr, UT::EError::Configuration,
                         "prompt of " + std::to_string(viPrompt.size()) + " ids exceeds max_seq_len " +
                             std::to_string(m_sModel.sConfig().iMaxSeqLen));

    m_sUtf8 = TK::SUtf8State();
    for (size_t i = 0; i < viPrompt.size(); i++) {
        const int32_t iId = viPrompt[i];
        if (iId < 0 || iId >= TK::kByteVocab)
            return UT::bFail(sErr, UT::EError::Encoding,
                             "prompt id " + std::to_string(iId) + " at " + std::to_string(i) + " outside [0, 259)");
        if (TK::CByteTokenizer::bIsReserved(iId))
            continue;
        if (!m_sUtf8.bAllows((uint8_t)iId))
            return UT::bFail(sErr, UT::EError::Encoding, "malformed utf-8 in prompt at id " + std::to_string(i));
        m_sUtf8.Push((uint8_t)iId);
    }

    m_viBuffer = viPrompt;
    m_lPromptLen = viPrompt.size();
    m_iGenerated = 0;
    m_iSteps = 0;
    m_cSampler.Reseed(m_sCfg.uSeed);

    m_sModel.EnableKvCache(m_sCfg.bKvCache);
    m_sModel.ResetKvCache();

    m_eState = EGenState::Running;
    m_eStop = EStepResult::Continue;
    return true;
}

auto CGenerationState::eStop(EStepResult eReason) -> EStepResult {
    m_eState = EGenState::Stopped;
    m_eStop = eReason;
    return eReason;
}

auto CGenerationState::iRemainingBudget() const -> int32_t {
    const int64_t lBySeq = (int64_t)m_sModel.sConfig().iMaxSeqLen - (int64_t)m_viBuffer.size();
    const int64_t lByNew = (int64_t)m_sCfg.iMaxNewBytes - m_iGenerated;
    return (int32_t)std::max<int64_t>(0, std::min(lBySeq, lByNew));
}

auto CGenerationState::vbAllowedIds() const -> std::vector<bool> {
    std::vector<bool> vbAllowed(TK::kByteVocab, false);
    const int32_t iBudget = iRemainingBudget();

    for (int32_t b = 0; b < 256; b++) {
        if (!m_sCfg.bUtf8Constrain) {
            vbAllowed[b] = true;
            continue;
        }
        const uint8_t u = (uint8_t)b;
        if (!m_sUtf8.bAllows(u))
            continue;
        // a lead byte only if its whole character still fits
        if (m_sUtf8.bAtBoundary() && TK::SUtf8State::iSeqLen(u) > iBudget)
            continue;
        vbAllowed[b] = true;
    }

    vbAllowed[TK::kEosId] = !m_sCfg.bUtf8Constrain || m_sUtf8.bAtBoundary();
    return vbAllowed;
}

auto CGenerationState::eStep(UT::SError &sErr) -> EStepResult {
    if (m_eState == EGenState::Stopped)
        return m_eStop;
    if (m_eState == EGenState::Start) {
        UT::bFail(sErr, UT::EError::Internal, "step before bStart");
        return eStop(EStepResult::Error);
    }

    if (m_iGenerated >= m_sCfg.iMaxNewBytes)
        return eStop(EStepResult::MaxNewBytes);
    if ((int64_t)m_viBuffer.size() >= m_sModel.sConfig().iMaxSeqLen)
        return eStop(EStepResult::MaxSeqLen);

    m_iSteps++;

    // the cache already holds every position but the newest
    const int64_t lPosStart = m_sModel.bKvCacheEnabled() ? m_sModel.lCachedLen() : 0;

    CTensor tLogits;
    if (!m_sModel.bForward(m_viBuffer, lPosStart, tLogits, sErr))
        return eStop(EStepResult::Error);

    const std::vector<bool> vbAllowed = vbAllowedIds();
    const int32_t iNext =
        m_cSampler.iSample(tLogits.pfRow(tLogits.lRows() - 1), vbAllowed, m_sCfg.fTemperature, m_sCfg.iTopK);

    if (iNext < 0 || iNext >= TK::kByteVocab || !vbAllowed[iNext]) {
        UT::bFail(sErr, UT::EError::Internal, "sampled id " + std::to_string(iNext) + " outside the allowed set");
        return eStop(EStepResult::Error);
    }

    if (iNext == TK::kEosId)
        return eStop(EStepResult::Eos);

    m_sUtf8.Push((uint8_t)iNext);
    m_viBuffer.push_back(iNext);
    m_iGenerated++;
    return EStepResult::Continue;
}

auto CGenerationState::viGenerated() const -> std::vector<int32_t> {
    return std::vector<int32_t>(m_viBuffer.begin() + m_lPromptLen, m_viBuffer.end());
}
// >>>s_end(state)

// <<<s_start(generate)
// --- one shot driver
auto bGenerate(BL::CByteLatentModel &sModel, const TK::CByteTokenizer &cTok, const std::string &szPrompt,
               const SGenConfig &sCfg, SGenResult &sResult, UT::SError &sErr,
               const std::function<void(uint8_t)> &lfnOnByte) -> bool {
    sResult = SGenResult();

    std::vector<int32_t> viPrompt;
    if (!cTok.bEncode(szPrompt, viPrompt, sErr, true, false))
        return false;
    sResult.iPromptLen = (int32_t)viPrompt.size();

    CGenerationState sState(sModel, sCfg);
    if (!sState.bStart(viPrompt, sErr))
        return false;

    auto tStart = std::chrono::high_resolution_clock::now();
    auto tFirst = tStart;

    EStepResult eResult = EStepResult::Continue;
    while (eResult == EStepResult::Continue) {
        eResult = sState.eStep(sErr);
        if (sState.iSteps() == 1)
            tFirst = std::chrono::high_resolution_clock::now();
        if (eResult == EStepResult::Continue && lfnOnByte)
            lfnOnByte((uint8_t)sState.viBuffer().back());
    }

    auto tEnd = std::chrono::high_resolution_clock::now();
    sResult.eStop = eResult;
    sResult.viBytes = sState.viGenerated();
    sResult.dTotalMs = std::chrono::duration<double, std::milli>(tEnd - tStart).count();
    sResult.dFirstMs = std::chrono::duration<double, std::milli>(tFirst - tStart).count();
    sResult.dBytesPerSec = sResult.dTotalMs > 0.0 ? sResult.viBytes.size() / (sResult.dTotalMs / 1000.0) : 0.0;

    if (eResult == EStepResult::Error)
        return false;
    return cTok.bDecode(sResult.viBytes, sResult.szText, sErr);
}
// >>>s_end(generate)
} // namespace GN
