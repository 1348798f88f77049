// Created by Unium on 10.03.26

#include "blLtXatn.hpp"
#include "../Model/mdMdKern.hpp"
#include "../Tensor/mtTnOps_.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <utility>

using namespace MT;

namespace BL {

void PatchSpans(int64_t lPosStart, int64_t lRows, const std::vector<int64_t> &vlBounds, EPatchMask eMask,
                std::vector<int64_t> &vlBegin, std::vector<int64_t> &vlEnd) {
    const int64_t lPatches = (int64_t)vlBounds.size() - 1;
    vlBegin.assign(lRows, 0);
    vlEnd.assign(lRows, lPatches);
    if (eMask == EPatchMask::None)
        return;

    // patch j closes at vlBounds[j + 1], the list is sorted so walk it once
    int64_t lVisible = 0;
    for (int64_t r = 0; r < lRows; r++) {
        const int64_t lPos = lPosStart + r;
        while (lVisible < lPatches && vlBounds[lVisible + 1] <= lPos)
            lVisible++;
        vlEnd[r] = lVisible;
    }
}

auto InitCrossAttnWeights(const MD::SBlockConfig &sCfg, float fStd, float fGateInit, std::mt19937 &rng)
    -> SCrossAttnWeights {
    // same shapes as a decoder block, plus the two gates
    MD::SBlockWeights sBlk = MD::InitBlockWeights(sCfg, fStd, rng);

    SCrossAttnWeights sW;
    sW.tCaNorm = std::move(sBlk.tSaNorm);
    sW.tWq = std::move(sBlk.tWq);
    sW.tBq = std::move(sBlk.tBq);
    sW.tWk = std::move(sBlk.tWk);
    sW.tBk = std::move(sBlk.tBk);
    sW.tWv = std::move(sBlk.tWv);
    sW.tBv = std::move(sBlk.tBv);
    sW.tWo = std::move(sBlk.tWo);
    sW.tMlpNorm = std::move(sBlk.tMlpNorm);
    sW.tW1 = std::move(sBlk.tW1);
    sW.tW2 = std::move(sBlk.tW2);
    sW.tW3 = std::move(sBlk.tW3);
    sW.tCaGate = CTensor::Fill({1}, fGateInit);
    sW.tMlpGate = CTensor::Fill({1}, fGateInit);
    return sW;
}

CCrossAttnBlock::CCrossAttnBlock(MD::IBlockTransform *pInner, const MD::SBlockConfig &sCfg,
                                 SCrossAttnWeights sWeights, const SPatchContext *psContext)
    : m_pInner(pInner), m_sCfg(sCfg), m_sW(std::move(sWeights)), m_psContext(psContext) {
    assert(m_pInner != nullptr && "[bl:xattn] nothing to wrap");
}

/*---------------------------------------------------------
 * FN: Apply
 * DESC: inner block first, then the two gated updates. with
 *       no patches at all the inner output is returned as is
 * PARMS: tHidden ([n, dim]), lPosStart (position of row 0)
 * AUTH: unium (10.03.26 R: 12.03.26)
 *-------------------------------------------------------*/
auto CCrossAttnBlock::Apply(const CTensor &tHidden, int64_t lPosStart) -> CTensor {
    CTensor tH = m_pInner->Apply(tHidden, lPosStart);
    if (m_psContext == nullptr || m_psContext->tPatches.bEmpty())
        return tH;

    const SPatchContext &sCtx = *m_psContext;
    const int64_t lRows = tH.lRows();
    assert(sCtx.tPatches.lCols() == m_sCfg.iDim && "[bl:xattn] patch width != model dim");
    assert(sCtx.tPatches.lRows() + 1 == (int64_t)sCtx.vlBounds.size());

    std::vector<int64_t> vlBegin, vlEnd;
    PatchSpans(lPosStart, lRows, sCtx.vlBounds, sCtx.eMask, vlBegin, vlEnd);

    const float fCaGate = std::tanh(m_sW.tCaGate.fFlat(0));
    const float fMlpGate = std::tanh(m_sW.tMlpGate.fFlat(0));

    // cross attention sl
    {
        auto tNormed = OP::RmsNorm(tH, m_sW.tCaNorm, m_sCfg.fRmsEps);
        auto tQ = OP::Linear(tNormed, m_sW.tWq, m_sW.tBq);
        auto tK = OP::Linear(sCtx.tPatches, m_sW.tWk, m_sW.tBk);
        auto tV = OP::Linear(sCtx.tPatches, m_sW.tWv, m_sW.tBv);

        // no rope, patches carry no position
        MD::SAttnShape sShape{m_sCfg.iNHeads, m_sCfg.iNKvHeads, m_sCfg.iHeadDim};
        auto tAttn = MD::SpanAttention(tQ, tK, tV, sShape, vlBegin, vlEnd);

        // empty spans leave zero rows and output_proj has no bias
        OP::AddScaledInplace(tH, OP::Linear(tAttn, m_sW.tWo), fCaGate);
    }

    // ffn sl
    {
        auto tNormed = OP::RmsNorm(tH, m_sW.tMlpNorm, m_sCfg.fRmsEps);
        auto tMlp = MD::SwiGlu(tNormed, m_sW.tW1, m_sW.tW3, m_sW.tW2);
        const int64_t lDim = tMlp.lCols();
        for (int64_t r = 0; r < lRows; r++) {
            if (vlEnd[r] > vlBegin[r])
                continue;
            float *pfRow = tMlp.pfRow(r);
            std::fill(pfRow, pfRow + lDim, 0.0f);
        }
        OP::AddScaledInplace(tH, tMlp, fMlpGate);
    }

    return tH;
}

void CCrossAttnBlock::RegisterParams(MD::CParamRegistry &sReg, const std::string &szPrefix) {
    const MD::EOrigin eNew = MD::EOrigin::New;
    sReg.Add(szPrefix + "ca_norm.scale", m_sW.tCaNorm, eNew);
    sReg.Add(szPrefix + "attn.q_proj.weight", m_sW.tWq, eNew);
    sReg.Add(szPrefix + "attn.q_proj.bias", m_sW.tBq, eNew);
    sReg.Add(szPrefix + "attn.k_proj.weight", m_sW.tWk, eNew);
    sReg.Add(szPrefix + "attn.k_proj.bias", m_sW.tBk, eNew);
    sReg.Add(szPrefix + "attn.v_proj.weight", m_sW.tWv, eNew);
    sReg.Add(szPrefix + "attn.v_proj.bias", m_sW.tBv, eNew);
    sReg.Add(szPrefix + "attn.output_proj.weight", m_sW.tWo, eNew);
    sReg.Add(szPrefix + "ca_scale.scale", m_sW.tCaGate, eNew);
    sReg.Add(szPrefix + "mlp_norm.scale", m_sW.tMlpNorm, eNew);
    sReg.Add(szPrefix + "mlp.w1.weight", m_sW.tW1, eNew);
    sReg.Add(szPrefix + "mlp.w2.weight", m_sW.tW2, eNew);
    sReg.Add(szPrefix + "mlp.w3.weight", m_sW.tW3, eNew);
    sReg.Add(szPrefix + "mlp_scale.scale", m_sW.tMlpGate, eNew);
}
} // namespace BL
