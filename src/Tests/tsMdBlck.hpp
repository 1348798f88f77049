// Created by Unium on 03.03.26

#pragma once

#include "../Model/mdMdBlck.hpp"
#include "../Model/mdMdConf.hpp"
#include "../Model/mdMdKern.hpp"
#include "../Model/mdMdParm.hpp"
#include "../Tensor/mtTnOps_.hpp"
#include "tsTsFixt.hpp"
#include "tsTsTstf.hpp"

#include <cmath>
#include <random>
#include <vector>

static auto sTinyBlockConfig(int32_t iWindow = 0) -> MD::SBlockConfig {
    MD::SBlockConfig sCfg;
    sCfg.iDim = 16;
    sCfg.iNHeads = 2;
    sCfg.iNKvHeads = 1;
    sCfg.iHeadDim = 8;
    sCfg.iHiddenDim = 32;
    sCfg.fRmsEps = 1e-6f;
    sCfg.fRopeTheta = 10000.0f;
    sCfg.iWindow = iWindow;
    sCfg.bQkvBias = true;
    return sCfg;
}

// <<<s_start(kernels)
// --- kernels
TEST(rope_position_zero_is_identity) {
    std::mt19937 rng(1);
    auto tX = CTensor::RandNormal({1, 16}, 1.0f, rng);
    auto tRef = tX.Clone();
    MD::ApplyRopeRows(tX, 2, 8, 0, 10000.0f);
    CheckTensorsClose(tX, tRef, 1e-6f);
}

TEST(rope_keeps_norm) {
    std::mt19937 rng(2);
    auto tX = CTensor::RandNormal({3, 16}, 1.0f, rng);
    auto tRef = tX.Clone();
    MD::ApplyRopeRows(tX, 2, 8, 5, 10000.0f);
    for (int64_t r = 0; r < 3; r++) {
        float fA = OP::fDot(tX.pfRow(r), tX.pfRow(r), 16);
        float fB = OP::fDot(tRef.pfRow(r), tRef.pfRow(r), 16);
        CheckClose(fA, fB, 1e-3f);
    }
}

TEST(causal_spans_window) {
    std::vector<int64_t> vlBegin, vlEnd;
    MD::CausalSpans(3, 3, 2, vlBegin, vlEnd);
    Check(vlBegin == std::vector<int64_t>({2, 3, 4}), "window of 2 starts one back");
    Check(vlEnd == std::vector<int64_t>({4, 5, 6}), "self included");

    MD::CausalSpans(0, 2, 0, vlBegin, vlEnd);
    Check(vlBegin == std::vector<int64_t>({0, 0}), "no window sees the prefix");
}

TEST(span_attention_single_key_copies_value) {
    // one key, softmax weight 1, output = value of the mapped kv head
    MD::SAttnShape sShape{2, 1, 2};
    auto tQ = CTensor::Fill({1, 4}, 0.3f);
    auto tK = CTensor::Fill({1, 2}, 1.0f);
    auto tV = CTensor::Zeros({1, 2});
    tV.fFlat(0) = 5.0f;
    tV.fFlat(1) = -2.0f;
    auto tOut = MD::SpanAttention(tQ, tK, tV, sShape, {0}, {1});
    CheckClose(tOut.fFlat(0), 5.0f);
    CheckClose(tOut.fFlat(1), -2.0f);
    CheckClose(tOut.fFlat(2), 5.0f);
    CheckClose(tOut.fFlat(3), -2.0f);
}

TEST(span_attention_empty_span_zero_row) {
    MD::SAttnShape sShape{1, 1, 2};
    auto tQ = CTensor::Fill({2, 2}, 1.0f);
    auto tK = CTensor::Fill({3, 2}, 1.0f);
    auto tV = CTensor::Fill({3, 2}, 4.0f);
    auto tOut = MD::SpanAttention(tQ, tK, tV, sShape, {0, 0}, {0, 3});
    CheckClose(tOut.fAt({0, 0}), 0.0f);
    CheckClose(tOut.fAt({0, 1}), 0.0f);
    CheckClose(tOut.fAt({1, 0}), 4.0f);

    auto tNone = MD::SpanAttention(tQ, CTensor(), CTensor(), sShape, {0, 0}, {1, 1});
    CheckClose(tNone.fAt({1, 1}), 0.0f);
}
// >>>s_end(kernels)

// <<<s_start(block)
// --- decoder block
TEST(block_output_shape_finite) {
    std::mt19937 rng(4);
    auto sCfg = sTinyBlockConfig();
    MD::CDecoderBlock cBlock(sCfg, MD::InitBlockWeights(sCfg, 0.1f, rng));
    auto tX = CTensor::RandNormal({5, 16}, 1.0f, rng);
    auto tY = cBlock.Apply(tX, 0);
    Check(tY.bSameShape({5, 16}), "shape");
    Check(OP::bAllFinite(tY), "finite");
}

TEST(block_is_causal) {
    std::mt19937 rng(5);
    auto sCfg = sTinyBlockConfig();
    MD::CDecoderBlock cBlock(sCfg, MD::InitBlockWeights(sCfg, 0.1f, rng));
    auto tX = CTensor::RandNormal({6, 16}, 1.0f, rng);
    auto tY = cBlock.Apply(tX, 0);

    // changing the last row never reaches earlier rows
    auto tX2 = tX.Clone();
    for (int64_t d = 0; d < 16; d++)
        tX2.fAt({5, d}) += 3.0f;
    auto tY2 = cBlock.Apply(tX2, 0);
    for (int64_t r = 0; r < 5; r++)
        for (int64_t d = 0; d < 16; d++)
            Check(tY.fAt({r, d}) == tY2.fAt({r, d}), "earlier rows unchanged");
}

TEST(block_window_limits_reach) {
    std::mt19937 rng(6);
    auto sCfg = sTinyBlockConfig(2);
    MD::CDecoderBlock cBlock(sCfg, MD::InitBlockWeights(sCfg, 0.1f, rng));
    auto tX = CTensor::RandNormal({6, 16}, 1.0f, rng);
    auto tY = cBlock.Apply(tX, 0);

    // row 5 sees rows 4 and 5 only
    auto tX2 = tX.Clone();
    for (int64_t d = 0; d < 16; d++)
        tX2.fAt({0, d}) -= 2.0f;
    auto tY2 = cBlock.Apply(tX2, 0);
    for (int64_t d = 0; d < 16; d++)
        Check(tY.fAt({5, d}) == tY2.fAt({5, d}), "row 0 is outside the window of row 5");
}

TEST(block_cache_matches_full) {
    std::mt19937 rng(7);
    auto sCfg = sTinyBlockConfig();
    MD::CDecoderBlock cBlock(sCfg, MD::InitBlockWeights(sCfg, 0.1f, rng));
    auto tX = CTensor::RandNormal({6, 16}, 1.0f, rng);
    auto tFull = cBlock.Apply(tX, 0);

    cBlock.EnableCache(16);
    Check(cBlock.bCacheEnabled(), "enabled");
    auto tHead = cBlock.Apply(OP::SliceRange(tX, 0, 4).Clone(), 0);
    Check(cBlock.lCacheLen() == 4, "cache holds the prompt");
    auto t4 = cBlock.Apply(OP::SliceRange(tX, 4, 5).Clone(), 4);
    auto t5 = cBlock.Apply(OP::SliceRange(tX, 5, 6).Clone(), 5);
    Check(cBlock.lCacheLen() == 6, "cache grew");

    for (int64_t d = 0; d < 16; d++) {
        CheckClose(tHead.fAt({3, d}), tFull.fAt({3, d}), 1e-5f);
        CheckClose(t4.fAt({0, d}), tFull.fAt({4, d}), 1e-5f);
        CheckClose(t5.fAt({0, d}), tFull.fAt({5, d}), 1e-5f);
    }

    cBlock.ResetCache();
    Check(cBlock.lCacheLen() == 0, "reset");
    cBlock.DisableCache();
    Check(!cBlock.bCacheEnabled(), "disabled");
}
// >>>s_end(block)

// <<<s_start(config)
// --- decoder config
TEST(model_config_from_json) {
    const std::string szPath = szTempPath("config.json");
    WriteTextFile(szPath, R"({
        "architectures": ["Qwen2ForCausalLM"],
        "hidden_size": 64, "num_hidden_layers": 2, "num_attention_heads": 4,
        "num_key_value_heads": 2, "intermediate_size": 128,
        "max_position_embeddings": 1024, "rms_norm_eps": 1e-06, "rope_theta": 1000000.0,
        "vocab_size": 151936
    })");

    MD::SModelConfig sCfg;
    UT::SError sErr;
    bool bOk = MD::bLoadModelConfig(szPath, sCfg, sErr);
    std::remove(szPath.c_str());

    Check(bOk, "loads");
    Check(sCfg.iDim == 64 && sCfg.iNLayers == 2, "dims");
    Check(sCfg.iHeadDim == 16, "head dim derived from hidden / heads");
    Check(sCfg.bHasAttnBias, "qwen2 has qkv bias");
    CheckClose(sCfg.fRopeTheta, 1000000.0f, 1.0f);
}

TEST(model_config_rejects_bad_heads) {
    MD::SModelConfig sCfg;
    sCfg.iNHeads = 16;
    sCfg.iNKvHeads = 3;
    UT::SError sErr;
    Check(!MD::bValidateModelConfig(sCfg, sErr), "16 heads over 3 kv heads");
    Check(sErr.eCode == UT::EError::Configuration, "configuration error");

    UT::SError sErr2;
    Check(!MD::bLoadModelConfig("/nonexistent/config.json", sCfg, sErr2), "missing file");
}
// >>>s_end(config)

// <<<s_start(registry)
// --- parameter registry
TEST(registry_block_names) {
    std::mt19937 rng(8);
    auto sCfg = sTinyBlockConfig();
    sCfg.bQkvBias = false;
    auto sW = MD::InitBlockWeights(sCfg, 0.1f, rng);

    MD::CParamRegistry cReg;
    MD::AddBlockParams(cReg, "layers.0.", sW, MD::EOrigin::Inherited);
    Check(cReg.iCount() == 9, "biases absent, 9 tensors");
    Check(cReg.psFind("layers.0.attn.output_proj.weight") != nullptr, "output proj");
    Check(cReg.psFind("layers.0.attn.q_proj.bias") == nullptr, "no bias registered");
    Check(cReg.psFind("layers.0.attn.output_proj.weight")->ptTensor == &sW.tWo, "points at the weight");
    Check(cReg.vszNames(MD::EOrigin::New).empty(), "nothing new");
    Check(cReg.lNumel(MD::EOrigin::Inherited) == 16 + 16 * 16 + 8 * 16 * 2 + 16 * 16 + 16 + 32 * 16 * 3,
          "numel sum");

    cReg.Clear();
    Check(cReg.iCount() == 0, "cleared");
}
// >>>s_end(registry)
