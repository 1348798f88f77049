// Created by Unium on 07.03.26

#pragma once

#include "../Latent/blLtConf.hpp"
#include "tsTsFixt.hpp"
#include "tsTsTstf.hpp"

#include <string>
#include <vector>

// <<<s_start(adapter)
// --- adapter layer selection
TEST(adapter_layers_last) {
    BL::SAdapterConfig sA;
    sA.szSpec = "last:2";
    std::vector<int32_t> viOut;
    UT::SError sErr;
    Check(BL::bResolveAdapterLayers(sA, 3, viOut, sErr), "resolves");
    Check(viOut == std::vector<int32_t>({1, 2}), "last two of three");

    sA.szSpec = "last:10";
    Check(BL::bResolveAdapterLayers(sA, 3, viOut, sErr), "clamped");
    Check(viOut == std::vector<int32_t>({0, 1, 2}), "every layer");
}

TEST(adapter_layers_every) {
    BL::SAdapterConfig sA;
    sA.szSpec = "every:2";
    std::vector<int32_t> viOut;
    UT::SError sErr;
    Check(BL::bResolveAdapterLayers(sA, 5, viOut, sErr), "resolves");
    Check(viOut == std::vector<int32_t>({0, 2, 4}), "stride 2 from 0");
}

TEST(adapter_layers_explicit) {
    BL::SAdapterConfig sA;
    sA.viLayers = {2, 0, 2};
    std::vector<int32_t> viOut;
    UT::SError sErr;
    Check(BL::bResolveAdapterLayers(sA, 3, viOut, sErr), "resolves");
    Check(viOut == std::vector<int32_t>({0, 2}), "sorted and de-duplicated");

    sA.viLayers = {0, 3};
    Check(!BL::bResolveAdapterLayers(sA, 3, viOut, sErr), "3 is past the last layer");
    Check(sErr.eCode == UT::EError::Configuration, "configuration error");
    Check(sErr.szWhat.find("index 3") != std::string::npos, "names the index");
}

TEST(adapter_layers_bad_spec) {
    BL::SAdapterConfig sA;
    std::vector<int32_t> viOut;
    for (const char *pszSpec : {"last", "last:", "last:0", "last:2x", "first:2", "every:-1"}) {
        UT::SError sErr;
        sA.szSpec = pszSpec;
        Check(!BL::bResolveAdapterLayers(sA, 4, viOut, sErr), std::string("rejects ") + pszSpec);
        Check(sErr.eCode == UT::EError::Configuration, "configuration error");
    }
}
// >>>s_end(adapter)

// <<<s_start(validate)
// --- validation
TEST(patcher_config_rejects) {
    UT::SError sErr;
    BL::SPatcherConfig sP;
    Check(BL::bValidatePatcherConfig(sP, sErr), "defaults are fine");

    sP.iMinPatch = 5;
    sP.iMaxPatch = 4;
    Check(!BL::bValidatePatcherConfig(sP, sErr), "min > max");

    sP = BL::SPatcherConfig();
    sP.iMinPatch = 0;
    Check(!BL::bValidatePatcherConfig(sP, sErr), "min 0");

    sP = BL::SPatcherConfig();
    sP.fMinThreshold = 6.0f;
    Check(!BL::bValidatePatcherConfig(sP, sErr), "threshold clamps crossed");
}

TEST(blt_config_tiny_is_valid) {
    UT::SError sErr;
    auto sCfg = sTinyConfig();
    Check(BL::bValidateBltConfig(sCfg, sErr), sErr.szFormat());
}

TEST(blt_config_rejects_dims) {
    UT::SError sErr;
    auto sCfg = sTinyConfig();
    sCfg.bProjectPatches = false;
    Check(!BL::bValidateBltConfig(sCfg, sErr), "local 8 vs decoder 16 with no projector");
    Check(sErr.szWhat.find("local_to_global_dim_proj") != std::string::npos, "names the switch");

    sCfg = sTinyConfig();
    sCfg.iMaxSeqLen = 1024;
    Check(!BL::bValidateBltConfig(sCfg, sErr), "longer than the local encoder allows");

    sCfg = sTinyConfig();
    sCfg.sLocal.iDim = 9;
    Check(!BL::bValidateBltConfig(sCfg, sErr), "9 over 2 heads");

    sCfg = sTinyConfig();
    sCfg.sLocal.bHashNgrams = true;
    sCfg.sLocal.viNgramSizes = {3, 0};
    Check(!BL::bValidateBltConfig(sCfg, sErr), "0-gram");
}
// >>>s_end(validate)

// <<<s_start(load)
// --- blt_config.json
TEST(blt_config_from_json) {
    const std::string szPath = szTempPath("blt_config.json");
    WriteTextFile(szPath, R"({
        "patch_size": 6, "min_patch_size": 2, "entropy_window": 4,
        "threshold_mode": "adaptive", "patching_threshold": 2.5,
        "pool_mode": "max", "cross_attend_layers": [2, 1], "patch_mask": "none",
        "local_window": 32, "use_hash_ngrams": 1, "hash_ngram_sizes": [2, 3], "hash_buckets": 97,
        "strict_load": true, "exclude_params": ["output.weight"], "max_seq_len": 128
    })");

    auto sCfg = sTinyConfig();
    UT::SError sErr;
    bool bOk = BL::bLoadBltConfig(szPath, sCfg, sErr);
    std::remove(szPath.c_str());

    Check(bOk, sErr.szFormat());
    Check(sCfg.sPatcher.iMaxPatch == 6 && sCfg.sPatcher.iMinPatch == 2, "patch bounds");
    Check(sCfg.sPatcher.eThreshold == BL::EThresholdMode::Adaptive, "adaptive");
    CheckClose(sCfg.sPatcher.fThreshold, 2.5f);
    Check(sCfg.ePool == BL::EPoolMode::Max, "max pooling");
    Check(sCfg.sAdapter.viLayers == std::vector<int32_t>({2, 1}), "explicit layers kept as written");
    Check(sCfg.sAdapter.eMask == BL::EPatchMask::None, "no mask");
    Check(sCfg.sLocal.iWindow == 32, "window");
    Check(sCfg.sLocal.bHashNgrams, "1 reads as on");
    Check(sCfg.sLocal.viNgramSizes == std::vector<int32_t>({2, 3}), "ngram sizes");
    Check(sCfg.bStrictLoad, "strict");
    Check(sCfg.vszExcludeParams == std::vector<std::string>({"output.weight"}), "exclude list replaced");
    Check(sCfg.iMaxSeqLen == 128, "max seq");
    Check(sCfg.sDecoder.iDim == 16, "decoder shape untouched");
}

TEST(blt_config_bool_and_errors) {
    const std::string szPath = szTempPath("blt_bool.json");
    WriteTextFile(szPath, R"({ "use_hash_ngrams": true })");
    auto sCfg = sTinyConfig();
    UT::SError sErr;
    Check(BL::bLoadBltConfig(szPath, sCfg, sErr), sErr.szFormat());
    Check(sCfg.sLocal.bHashNgrams, "true reads as on");

    WriteTextFile(szPath, R"({ "pool_mode": "median" })");
    sCfg = sTinyConfig();
    Check(!BL::bLoadBltConfig(szPath, sCfg, sErr), "unknown pool mode");
    Check(sErr.szWhat.find("median") != std::string::npos, "names the value");

    WriteTextFile(szPath, R"({ "cross_attend_spec": "last:zero" })");
    sCfg = sTinyConfig();
    Check(!BL::bLoadBltConfig(szPath, sCfg, sErr), "bad spec caught on load");
    std::remove(szPath.c_str());

    Check(!BL::bLoadBltConfig(szTempPath("missing.json"), sCfg, sErr), "missing file");
    Check(sErr.eCode == UT::EError::Configuration, "configuration error");
}

TEST(enum_names_parse_back) {
    BL::EPoolMode ePool;
    for (auto e : {BL::EPoolMode::Mean, BL::EPoolMode::Last, BL::EPoolMode::Max}) {
        Check(BL::bParsePoolMode(BL::szPoolModeName(e), ePool), "parses");
        Check(ePool == e, "round trip");
    }
    BL::EEntropyMode eEnt;
    Check(BL::bParseEntropyMode("predictor", eEnt) && eEnt == BL::EEntropyMode::Predictor, "predictor");
    Check(!BL::bParseEntropyMode("oracle", eEnt), "unknown");
    BL::EPatchMask eMask;
    Check(BL::bParsePatchMask("closed", eMask) && eMask == BL::EPatchMask::Closed, "closed");
}
// >>>s_end(load)
