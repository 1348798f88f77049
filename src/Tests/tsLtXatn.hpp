// Created by Unium on 11.03.26

#pragma once

#include "../Latent/blLtXatn.hpp"
#include "../Model/mdMdBlck.hpp"
#include "../Model/mdMdParm.hpp"
#include "tsTsFixt.hpp"
#include "tsTsTstf.hpp"

#include <memory>
#include <random>
#include <vector>

// <<<s_start(spans)
// --- patch visibility
TEST(patch_spans_closed) {
    std::vector<int64_t> vlBegin, vlEnd;
    BL::PatchSpans(0, 6, {0, 2, 5, 6}, BL::EPatchMask::Closed, vlBegin, vlEnd);
    Check(vlBegin == std::vector<int64_t>(6, 0), "spans start at patch 0");
    Check(vlEnd == std::vector<int64_t>({0, 0, 1, 1, 1, 2}), "a patch is visible once it has closed");

    // a cached step at position 5 sees the same as row 5 above
    BL::PatchSpans(5, 1, {0, 2, 5, 6}, BL::EPatchMask::Closed, vlBegin, vlEnd);
    Check(vlEnd == std::vector<int64_t>({2}), "offset rows");
}

TEST(patch_spans_none) {
    std::vector<int64_t> vlBegin, vlEnd;
    BL::PatchSpans(0, 3, {0, 1, 3}, BL::EPatchMask::None, vlBegin, vlEnd);
    Check(vlEnd == std::vector<int64_t>({2, 2, 2}), "every row sees every patch");
}
// >>>s_end(spans)

// <<<s_start(block)
// --- gated cross attention block
struct SXattnRig {
    MD::SBlockConfig sCfg;
    std::unique_ptr<MD::CDecoderBlock> pInner;
    BL::SPatchContext sCtx;
    std::unique_ptr<BL::CCrossAttnBlock> pAdapted;
    CTensor tHidden;
};

static auto sMakeXattnRig(float fGate, uint32_t uSeed) -> std::unique_ptr<SXattnRig> {
    std::mt19937 rng(uSeed);
    auto pRig = std::make_unique<SXattnRig>();
    pRig->sCfg = sTinyConfig().sDecoder.sBlockConfig();
    pRig->pInner = std::make_unique<MD::CDecoderBlock>(pRig->sCfg, MD::InitBlockWeights(pRig->sCfg, 0.1f, rng));
    pRig->sCtx.tPatches = CTensor::RandNormal({2, 16}, 1.0f, rng);
    pRig->sCtx.vlBounds = {0, 2, 5};
    pRig->pAdapted = std::make_unique<BL::CCrossAttnBlock>(
        pRig->pInner.get(), pRig->sCfg, BL::InitCrossAttnWeights(pRig->sCfg, 0.1f, fGate, rng), &pRig->sCtx);
    pRig->tHidden = CTensor::RandNormal({5, 16}, 1.0f, rng);
    return pRig;
}

TEST(xattn_zero_gate_is_identity) {
    auto pRig = sMakeXattnRig(0.0f, 31);
    auto tRef = pRig->pInner->Apply(pRig->tHidden, 0);
    auto tOut = pRig->pAdapted->Apply(pRig->tHidden, 0);
    Check(bTensorsEqual(tOut, tRef), "tanh(0) gates leave the inner output bit for bit");
}

TEST(xattn_gate_touches_only_seeing_rows) {
    auto pRig = sMakeXattnRig(0.8f, 32);
    auto tRef = pRig->pInner->Apply(pRig->tHidden, 0);
    auto tOut = pRig->pAdapted->Apply(pRig->tHidden, 0);

    // rows 0 and 1 sit inside the first patch, nothing has closed yet
    for (int64_t r = 0; r < 2; r++)
        for (int64_t d = 0; d < 16; d++)
            Check(tOut.fAt({r, d}) == tRef.fAt({r, d}), "blind rows untouched");

    bool bMoved = false;
    for (int64_t r = 2; r < 5; r++)
        for (int64_t d = 0; d < 16; d++)
            bMoved = bMoved || tOut.fAt({r, d}) != tRef.fAt({r, d});
    Check(bMoved, "rows past a closed patch are updated");
}

TEST(xattn_no_patches_passthrough) {
    auto pRig = sMakeXattnRig(0.8f, 33);
    pRig->sCtx.tPatches = CTensor();
    pRig->sCtx.vlBounds = {0};
    auto tRef = pRig->pInner->Apply(pRig->tHidden, 0);
    auto tOut = pRig->pAdapted->Apply(pRig->tHidden, 0);
    Check(bTensorsEqual(tOut, tRef), "no context, inner output");
}

TEST(xattn_mask_none_reaches_all_rows) {
    auto pRig = sMakeXattnRig(0.8f, 34);
    pRig->sCtx.eMask = BL::EPatchMask::None;
    auto tRef = pRig->pInner->Apply(pRig->tHidden, 0);
    auto tOut = pRig->pAdapted->Apply(pRig->tHidden, 0);
    bool bMoved = false;
    for (int64_t d = 0; d < 16; d++)
        bMoved = bMoved || tOut.fAt({0, d}) != tRef.fAt({0, d});
    Check(bMoved, "row 0 sees patches without the mask");
}

TEST(xattn_param_names) {
    auto pRig = sMakeXattnRig(0.0f, 35);
    MD::CParamRegistry cReg;
    pRig->pAdapted->RegisterParams(cReg, "layers.2.fusion_layer.");
    Check(cReg.iCount() == 14, "12 block tensors + 2 gates");
    Check(cReg.psFind("layers.2.fusion_layer.ca_scale.scale")->ptTensor->bSameShape({1}), "scalar gate");
    Check(cReg.psFind("layers.2.fusion_layer.mlp_scale.scale") != nullptr, "mlp gate");
    Check(cReg.vszNames(MD::EOrigin::New).size() == 14, "all new");
    Check(pRig->pAdapted->pInner() == pRig->pInner.get(), "wraps the given block");
}
// >>>s_end(block)
