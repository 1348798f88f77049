// Created by Unium on 24.02.26

#include "mdMdConf.hpp"
#include "../Util/utUtJson.hpp"
#include <iostream>

namespace MD {

auto SModelConfig::sBlockConfig() const -> SBlockConfig {
    SBlockConfig sBlk;
    sBlk.iDim = iDim;
    sBlk.iNHeads = iNHeads;
    sBlk.iNKvHeads = iNKvHeads;
    sBlk.iHeadDim = iHeadDim;
    sBlk.iHiddenDim = iHiddenDim;
    sBlk.fRmsEps = fRmsEps;
    sBlk.fRopeTheta = fRopeTheta;
    sBlk.iWindow = 0;
    sBlk.bQkvBias = bHasAttnBias;
    return sBlk;
}

auto bLoadModelConfig(const std::string &szPath, SModelConfig &sConfig, UT::SError &sErr) -> bool {
    std::string szJson = UT::szReadFileToString(szPath);
    if (szJson.empty())
        return UT::bFail(sErr, UT::EError::Configuration, "cannot read " + szPath);

    sConfig.szArchitecture = UT::szExtractJsonArrayFirst(szJson, "architectures");
    if (sConfig.szArchitecture.empty())
        sConfig.szArchitecture = UT::szExtractJsonString(szJson, "model_type", "unknown");

    sConfig.iVocabSize = UT::iExtractJsonInt(szJson, "vocab_size", sConfig.iVocabSize);
    sConfig.iDim = UT::iExtractJsonInt(szJson, "hidden_size", sConfig.iDim);
    sConfig.iNLayers = UT::iExtractJsonInt(szJson, "num_hidden_layers", sConfig.iNLayers);
    sConfig.iNHeads = UT::iExtractJsonInt(szJson, "num_attention_heads", sConfig.iNHeads);
    sConfig.iNKvHeads = UT::iExtractJsonInt(szJson, "num_key_value_heads", 0);
    sConfig.iMaxSeqLen = UT::iExtractJsonInt(szJson, "max_position_embeddings", sConfig.iMaxSeqLen);

    sConfig.iHiddenDim = UT::iExtractJsonInt(szJson, "intermediate_size", 0);
    if (sConfig.iHiddenDim == 0)
        sConfig.iHiddenDim = 4 * sConfig.iDim;

    sConfig.fRmsEps = UT::fExtractJsonFloat(szJson, "rms_norm_eps", sConfig.fRmsEps);
    sConfig.fRopeTheta = UT::fExtractJsonFloat(szJson, "rope_theta", sConfig.fRopeTheta);

    if (sConfig.iNKvHeads <= 0)
        sConfig.iNKvHeads = sConfig.iNHeads;

    sConfig.iHeadDim = UT::iExtractJsonInt(szJson, "head_dim", 0);
    if (sConfig.iHeadDim <= 0 && sConfig.iNHeads > 0)
        sConfig.iHeadDim = sConfig.iDim / sConfig.iNHeads;

    // qwen2 configs omit the key but always carry q/k/v biases
    bool bQwen2 = sConfig.szArchitecture.find("Qwen2") != std::string::npos;
    sConfig.bHasAttnBias = UT::bExtractJsonBool(szJson, "attention_bias", bQwen2);

    std::cout << "  config loaded from " << szPath << std::endl;
    return bValidateModelConfig(sConfig, sErr);
}

auto bValidateBlockConfig(const SBlockConfig &sCfg, const std::string &szWho, UT::SError &sErr) -> bool {
    auto bBad = [&](const std::string &szWhat) { return UT::bFail(sErr, UT::EError::Configuration, szWho + szWhat); };

    if (sCfg.iDim <= 0)
        return bBad(" dim must be positive");
    if (sCfg.iNHeads <= 0 || sCfg.iNKvHeads <= 0)
        return bBad(" head counts must be positive");
    if (sCfg.iNHeads % sCfg.iNKvHeads != 0)
        return bBad(" num_heads " + std::to_string(sCfg.iNHeads) + " is not a multiple of num_kv_heads " +
                    std::to_string(sCfg.iNKvHeads));
    if (sCfg.iHeadDim <= 0 || sCfg.iHeadDim % 2 != 0)
        return bBad(" head_dim must be positive and even, got " + std::to_string(sCfg.iHeadDim));
    if (sCfg.iHiddenDim <= 0)
        return bBad(" hidden_dim must be positive");
    if (sCfg.iWindow < 0)
        return bBad(" attention window must be >= 0");
    if (!(sCfg.fRmsEps > 0.0f))
        return bBad(" rms_eps must be positive");
    return true;
}

auto bValidateModelConfig(const SModelConfig &sCfg, UT::SError &sErr) -> bool {
    if (sCfg.iNLayers <= 0)
        return UT::bFail(sErr, UT::EError::Configuration, "decoder num_hidden_layers must be positive");
    if (sCfg.iMaxSeqLen <= 0)
        return UT::bFail(sErr, UT::EError::Configuration, "decoder max_position_embeddings must be positive");
    return bValidateBlockConfig(sCfg.sBlockConfig(), "decoder", sErr);
}

void PrintModelConfig(const SModelConfig &sCfg) {
    std::cout << "  architecture: " << sCfg.szArchitecture << std::endl;
    std::cout << "  dim=" << sCfg.iDim << " layers=" << sCfg.iNLayers << " heads=" << sCfg.iNHeads
              << " kv_heads=" << sCfg.iNKvHeads << " head_dim=" << sCfg.iHeadDim << " hidden=" << sCfg.iHiddenDim
              << std::endl;
    std::cout << "  attn_bias=" << (sCfg.bHasAttnBias ? "yes" : "no") << " rope_theta=" << sCfg.fRopeTheta
              << " rms_eps=" << sCfg.fRmsEps << " max_pos=" << sCfg.iMaxSeqLen << std::endl;
}
} // namespace MD
