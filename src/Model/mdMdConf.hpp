// Created by Unium on 24.02.26

#pragma once

#include "../Util/utUtErr_.hpp"
#include <cstdint>
#include <string>

namespace MD {
/*---------------------------------------------------------
 * FN: SBlockConfig
 * DESC: everything one transformer block needs to know about
 *       its shape. shared by the pretrained decoder blocks and
 *       the local encoder layers
 * AUTH: unium (03.03.26)
 *-------------------------------------------------------*/
struct SBlockConfig {
    int32_t iDim = 0;
    int32_t iNHeads = 0;
    int32_t iNKvHeads = 0;
    int32_t iHeadDim = 0;
    int32_t iHiddenDim = 0;
    float fRmsEps = 1e-6f;
    float fRopeTheta = 1000000.0f;
    int32_t iWindow = 0; // 0 = full causal
    bool bQkvBias = true;
};

// pretrained decoder, read from the hf config.json
struct SModelConfig {
    int32_t iVocabSize = 151936;
    int32_t iDim = 2048;
    int32_t iHiddenDim = 11008;
    int32_t iNLayers = 36;
    int32_t iNHeads = 16;
    int32_t iNKvHeads = 2;
    int32_t iHeadDim = 128;
    int32_t iMaxSeqLen = 32768;
    float fRmsEps = 1e-6f;
    float fRopeTheta = 1000000.0f;
    bool bHasAttnBias = true;
    std::string szArchitecture = "Qwen2ForCausalLM";

    auto sBlockConfig() const -> SBlockConfig;
};

/*---------------------------------------------------------
 * FN: bLoadModelConfig
 * DESC: parses config.json and fills SModelConfig, keys that
 *       are missing keep their qwen2.5-3b defaults
 * PARMS: szPath (path to config.json), sConfig (output),
 *        sErr (status)
 * AUTH: unium (24.02.26 R: 05.03.26)
 *-------------------------------------------------------*/
auto bLoadModelConfig(const std::string &szPath, SModelConfig &sConfig, UT::SError &sErr) -> bool;

/*---------------------------------------------------------
 * FN: bValidateBlockConfig
 * DESC: rejects shapes the attention kernels cannot run:
 *       heads not dividing, odd head dim for rope, etc
 * PARMS: sCfg (block shape), szWho (prefix for messages),
 *        sErr (status)
 * AUTH: unium (05.03.26)
 *-------------------------------------------------------*/
auto bValidateBlockConfig(const SBlockConfig &sCfg, const std::string &szWho, UT::SError &sErr) -> bool;

auto bValidateModelConfig(const SModelConfig &sCfg, UT::SError &sErr) -> bool;

/*---------------------------------------------------------
 * FN: PrintModelConfig
 * DESC: prints the decoder shape to stdout
 * PARMS: sCfg (config)
 * AUTH: unium (24.02.26)
 *-------------------------------------------------------*/
void PrintModelConfig(const SModelConfig &sCfg);
} // namespace MD
