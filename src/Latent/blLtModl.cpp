// Created by Unium on 12.03.26

#include "blLtModl.hpp"
#include "../Tensor/mtTnOps_.hpp"
#include "../Tokenizer/tkTkByte.hpp"
#include <algorithm>
#include <random>

using namespace MT;

namespace BL {

constexpr float kInitStd = 0.02f;

// <<<s_start(build)
// --- construction
auto CByteLatentModel::bBuild(const SBltConfig &sCfg, uint32_t uSeed, UT::SError &sErr) -> bool {
    m_bBuilt = false;
    if (!bValidateBltConfig(sCfg, sErr))
        return false;

    std::vector<int32_t> viAdapted;
    if (!bResolveAdapterLayers(sCfg.sAdapter, sCfg.sDecoder.iNLayers, viAdapted, sErr))
        return false;

    m_sCfg = sCfg;
    m_viAdapterLayers = viAdapted;
    m_bKvCache = false;
    m_sCtx = SPatchContext();
    m_sCtx.eMask = sCfg.sAdapter.eMask;

    std::mt19937 rng(uSeed);
    const int64_t lDim = sCfg.sDecoder.iDim;
    const int64_t lLocal = sCfg.sLocal.iDim;

    // byte front end
    m_cLocal.Init(sCfg.sLocal, kInitStd, rng);

    m_tEntropyHead = CTensor();
    if (sCfg.sPatcher.eEntropy == EEntropyMode::Predictor)
        m_tEntropyHead = CTensor::RandNormal({TK::kByteVocab, lLocal}, kInitStd, rng);
    if (!m_cPatcher.bInit(sCfg.sPatcher, &m_tEntropyHead, sErr))
        return false;

    m_cPool = CPatchAggregator(sCfg.ePool);

    m_tProjW = CTensor();
    m_tProjB = CTensor();
    if (sCfg.bProjectPatches) {
        m_tProjW = CTensor::RandNormal({lDim, lLocal}, kInitStd, rng);
        m_tProjB = CTensor::Zeros({lDim});
    }

    // decoder, the pretrained tensors get overwritten by the checkpoint
    const MD::SBlockConfig sBlk = sCfg.sDecoder.sBlockConfig();
    m_tTokEmbed = CTensor::RandNormal({TK::kByteVocab, lDim}, kInitStd, rng);

    m_vpDecoder.clear();
    m_vpAdapters.clear();
    m_vpStack.clear();
    for (int32_t i = 0; i < sCfg.sDecoder.iNLayers; i++) {
        m_vpDecoder.push_back(std::make_unique<MD::CDecoderBlock>(sBlk, MD::InitBlockWeights(sBlk, kInitStd, rng)));
        m_vpStack.push_back(m_vpDecoder.back().get());
    }

    // block surgery: adapted slots point at a wrapper around the same block
    for (int32_t iLayer : m_viAdapterLayers) {
        SCrossAttnWeights sW = InitCrossAttnWeights(sBlk, kInitStd, sCfg.sAdapter.fGateInit, rng);
        m_vpAdapters.push_back(
            std::make_unique<CCrossAttnBlock>(m_vpDecoder[iLayer].get(), sBlk, std::move(sW), &m_sCtx));
        m_vpStack[iLayer] = m_vpAdapters.back().get();
    }

    m_tNorm = CTensor::Fill({lDim}, 1.0f);
    m_tOutput = CTensor::RandNormal({TK::kByteVocab, lDim}, kInitStd, rng);

    RegisterParams();
    m_bBuilt = true;
    return true;
}

void CByteLatentModel::RegisterParams() {
    using MD::EOrigin;
    m_cReg.Clear();

    m_cReg.Add("tok_embeddings.weight", m_tTokEmbed, EOrigin::New);

    size_t lAdapter = 0;
    for (int32_t i = 0; i < (int32_t)m_vpDecoder.size(); i++) {
        const std::string szPrefix = "layers." + std::to_string(i) + ".";
        MD::AddBlockParams(m_cReg, szPrefix, m_vpDecoder[i]->sWeights(), EOrigin::Inherited);
        if (bIsAdapted(i))
            m_vpAdapters[lAdapter++]->RegisterParams(m_cReg, szPrefix + "fusion_layer.");
    }

    m_cReg.Add("norm.scale", m_tNorm, EOrigin::Inherited);
    m_cReg.Add("output.weight", m_tOutput, EOrigin::New);

    m_cLocal.RegisterParams(m_cReg, "local_encoder.");
    m_cReg.Add("patch_projector.proj.weight", m_tProjW, EOrigin::New);
    m_cReg.Add("patch_projector.proj.bias", m_tProjB, EOrigin::New);
    m_cReg.Add("entropy_head.weight", m_tEntropyHead, EOrigin::New);
}

auto CByteLatentModel::bIsAdapted(int32_t iLayer) const -> bool {
    return std::binary_search(m_viAdapterLayers.begin(), m_viAdapterLayers.end(), iLayer);
}
// >>>s_end(build)

// <<<s_start(forward)
// --- forward pass
auto CByteLatentModel::bForward(const std::vector<int32_t> &viIds, int64_t lPosStart, CTensor &tLogits,
                                UT::SError &sErr) -> bool {
    if (!m_bBuilt)
        return UT::bFail(sErr, UT::EError::Internal, "forward on a model that was never built");

    const int64_t lLen = (int64_t)viIds.size();
    if (lLen == 0)
        return UT::bFail(sErr, UT::EError::Configuration, "forward needs at least one id");
    if (lLen > m_sCfg.iMaxSeqLen)
        return UT::bFail(sErr, UT::EError::Configuration,
                         "sequence of " + std::to_string(lLen) + " exceeds max_seq_len " +
                             std::to_string(m_sCfg.iMaxSeqLen));
    if (lPosStart < 0 || lPosStart >= lLen)
        return UT::bFail(sErr, UT::EError::Internal, "forward start " + std::to_string(lPosStart) + " outside [0, " +
                                                         std::to_string(lLen) + ")");
    if (m_bKvCache ? lPosStart != lCachedLen() : lPosStart != 0)
        return UT::bFail(sErr, UT::EError::Internal,
                         "forward start " + std::to_string(lPosStart) + " does not match cached length " +
                             std::to_string(lCachedLen()));

    // byte front end over the whole sequence
    CTensor tReps;
    if (!m_cLocal.bEncode(viIds, tReps, sErr))
        return false;

    std::vector<int64_t> vlBounds;
    if (!m_cPatcher.bSegment(viIds, tReps, vlBounds, sErr))
        return false;

    CTensor tPatches;
    if (!m_cPool.bPool(tReps, vlBounds, tPatches, sErr))
        return false;
    if (m_sCfg.bProjectPatches)
        tPatches = OP::Linear(tPatches, m_tProjW, m_tProjB);
    if (!OP::bAllFinite(tPatches))
        return UT::bFail(sErr, UT::EError::Numerical, "non-finite patch vectors");

    m_sCtx.tPatches = std::move(tPatches);
    m_sCtx.vlBounds = std::move(vlBounds);

    // decoder over the rows that still need computing
    std::vector<int32_t> viRows(viIds.begin() + lPosStart, viIds.end());
    CTensor tH = OP::GatherRows(m_tTokEmbed, viRows);

    for (int32_t i = 0; i < (int32_t)m_vpStack.size(); i++) {
        tH = m_vpStack[i]->Apply(tH, lPosStart);
        if (!OP::bAllFinite(tH))
            return UT::bFail(sErr, UT::EError::Numerical,
                             "non-finite hidden state after layer " + std::to_string(i) +
                                 (bIsAdapted(i) ? " (cross attention)" : ""));
    }

    auto tNormed = OP::RmsNorm(tH, m_tNorm, m_sCfg.sDecoder.fRmsEps);
    tLogits = OP::Linear(tNormed, m_tOutput);
    if (!OP::bAllFinite(tLogits))
        return UT::bFail(sErr, UT::EError::Numerical, "non-finite logits");
    return true;
}
// >>>s_end(forward)

// <<<s_start(cache)
// --- kv cache
void CByteLatentModel::EnableKvCache(bool bEnable) {
    m_bKvCache = bEnable;
    for (auto &pBlock : m_vpDecoder) {
        if (bEnable)
            pBlock->EnableCache(m_sCfg.iMaxSeqLen);
        else
            pBlock->DisableCache();
    }
}

void CByteLatentModel::ResetKvCache() {
    for (auto *pBlock : m_vpStack)
        pBlock->ResetCache();
}

auto CByteLatentModel::lCachedLen() const -> int64_t {
    if (!m_bKvCache || m_vpDecoder.empty())
        return 0;
    return m_vpDecoder.front()->lCacheLen();
}
// >>>s_end(cache)

// <<<s_start(checkpoint)
// --- checkpoint boundary
auto CByteLatentModel::bLoadCheckpoint(const MD::SCheckpointSpec &sSpec, MD::SLoadReport &sReport,
                                       UT::SError &sErr) -> bool {
    if (!m_bBuilt)
        return UT::bFail(sErr, UT::EError::Internal, "checkpoint load before build");
    return MD::bLoadCheckpoint(sSpec, m_cReg, sReport, sErr);
}

auto CByteLatentModel::bSaveNewParams(const std::string &szPath, UT::SError &sErr) const -> bool {
    return MD::bSaveParams(szPath, m_cReg, MD::EOrigin::New, sErr);
}
// >>>s_end(checkpoint)
} // namespace BL
