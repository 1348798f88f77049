// Created by Unium on 25.02.26

#include "mdMdBlck.hpp"
#include "../Tensor/mtTnOps_.hpp"
#include "mdMdKern.hpp"
#include <cassert>
#include <utility>
#include <vector>

using namespace MT;

namespace MD {

auto InitBlockWeights(const SBlockConfig &sCfg, float fStd, std::mt19937 &rng) -> SBlockWeights {
    const int64_t lDim = sCfg.iDim;
    const int64_t lQDim = (int64_t)sCfg.iNHeads * sCfg.iHeadDim;
    const int64_t lKvDim = (int64_t)sCfg.iNKvHeads * sCfg.iHeadDim;
    const int64_t lHidden = sCfg.iHiddenDim;

    SBlockWeights sW;
    sW.tSaNorm = CTensor::Fill({lDim}, 1.0f);
    sW.tWq = CTensor::RandNormal({lQDim, lDim}, fStd, rng);
    sW.tWk = CTensor::RandNormal({lKvDim, lDim}, fStd, rng);
    sW.tWv = CTensor::RandNormal({lKvDim, lDim}, fStd, rng);
    if (sCfg.bQkvBias) {
        sW.tBq = CTensor::Zeros({lQDim});
        sW.tBk = CTensor::Zeros({lKvDim});
        sW.tBv = CTensor::Zeros({lKvDim});
    }
    sW.tWo = CTensor::RandNormal({lDim, lQDim}, fStd, rng);
    sW.tMlpNorm = CTensor::Fill({lDim}, 1.0f);
    sW.tW1 = CTensor::RandNormal({lHidden, lDim}, fStd, rng);
    sW.tW2 = CTensor::RandNormal({lDim, lHidden}, fStd, rng);
    sW.tW3 = CTensor::RandNormal({lHidden, lDim}, fStd, rng);
    return sW;
}

CDecoderBlock::CDecoderBlock(const SBlockConfig &sCfg, SBlockWeights sWeights)
    : m_sCfg(sCfg), m_sW(std::move(sWeights)) {}

// <<<s_start(cache)
// --- kv cache
void CDecoderBlock::EnableCache(int64_t lMaxLen) {
    const int64_t lKvDim = (int64_t)m_sCfg.iNKvHeads * m_sCfg.iHeadDim;
    m_sKv.tK = CTensor::Zeros({lMaxLen, lKvDim});
    m_sKv.tV = CTensor::Zeros({lMaxLen, lKvDim});
    m_sKv.lLen = 0;
}

void CDecoderBlock::DisableCache() { m_sKv = SKvCache(); }

void CDecoderBlock::ResetCache() { m_sKv.lLen = 0; }
// >>>s_end(cache)

// <<<s_start(forward)
// --- forward pass
auto CDecoderBlock::Apply(const CTensor &tHidden, int64_t lPosStart) -> CTensor {
    const int64_t lRows = tHidden.lRows();
    SAttnShape sShape{m_sCfg.iNHeads, m_sCfg.iNKvHeads, m_sCfg.iHeadDim};

    CTensor tH = tHidden.Clone();

    // attention sl
    {
        auto tNormed = OP::RmsNorm(tH, m_sW.tSaNorm, m_sCfg.fRmsEps);
        auto tQ = OP::Linear(tNormed, m_sW.tWq, m_sW.tBq);
        auto tK = OP::Linear(tNormed, m_sW.tWk, m_sW.tBk);
        auto tV = OP::Linear(tNormed, m_sW.tWv, m_sW.tBv);

        ApplyRopeRows(tQ, m_sCfg.iNHeads, m_sCfg.iHeadDim, lPosStart, m_sCfg.fRopeTheta);
        ApplyRopeRows(tK, m_sCfg.iNKvHeads, m_sCfg.iHeadDim, lPosStart, m_sCfg.fRopeTheta);

        std::vector<int64_t> vlBegin, vlEnd;
        CausalSpans(lPosStart, lRows, m_sCfg.iWindow, vlBegin, vlEnd);

        CTensor tAttn;
        if (bCacheEnabled()) {
            assert(lPosStart == m_sKv.lLen && "[md:block] cached apply must continue where the cache ends");
            assert(lPosStart + lRows <= m_sKv.tK.lRows() && "[md:block] kv cache overflow");
            OP::CopyInto(m_sKv.tK, tK, lPosStart);
            OP::CopyInto(m_sKv.tV, tV, lPosStart);
            m_sKv.lLen = lPosStart + lRows;

            auto tKeys = OP::SliceRange(m_sKv.tK, 0, m_sKv.lLen);
            auto tVals = OP::SliceRange(m_sKv.tV, 0, m_sKv.lLen);
            tAttn = SpanAttention(tQ, tKeys, tVals, sShape, vlBegin, vlEnd);
        } else {
            assert(lPosStart == 0 && "[md:block] uncached apply needs the full sequence");
            tAttn = SpanAttention(tQ, tK, tV, sShape, vlBegin, vlEnd);
        }

        OP::AddScaledInplace(tH, OP::Linear(tAttn, m_sW.tWo));
    }

    // ffn sl
    {
        auto tNormed = OP::RmsNorm(tH, m_sW.tMlpNorm, m_sCfg.fRmsEps);
        OP::AddScaledInplace(tH, SwiGlu(tNormed, m_sW.tW1, m_sW.tW3, m_sW.tW2));
    }

    return tH;
}
// >>>s_end(forward)
} // namespace MD
