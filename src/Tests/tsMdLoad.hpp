// Created by Unium on 12.03.26

#pragma once

#include "../Model/mdMdLoad.hpp"
#include "../Model/mdMdParm.hpp"
#include "../Tensor/mtTnOps_.hpp"
#include "tsTsFixt.hpp"
#include "tsTsTstf.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

// header json + raw payload, the layout every safetensors file has
static void WriteRawSafetensors(const std::string &szPath, const std::string &szHeader,
                                const std::vector<uint8_t> &vuData) {
    std::ofstream ofs(szPath, std::ios::binary | std::ios::trunc);
    uint64_t lSize = szHeader.size();
    ofs.write(reinterpret_cast<const char *>(&lSize), 8);
    ofs.write(szHeader.data(), (std::streamsize)szHeader.size());
    ofs.write(reinterpret_cast<const char *>(vuData.data()), (std::streamsize)vuData.size());
    Check(ofs.good(), "could not write safetensors fixture");
}

static auto sSpecFor(const std::string &szFile) -> MD::SCheckpointSpec {
    MD::SCheckpointSpec sSpec;
    sSpec.vszFiles = {szFile};
    sSpec.vszExclude.clear();
    return sSpec;
}

// <<<s_start(names)
// --- name mapping
TEST(hf_name_mapping) {
    Check(MD::szMapHfName("model.embed_tokens.weight") == "tok_embeddings.weight", "embedding");
    Check(MD::szMapHfName("lm_head.weight") == "output.weight", "head");
    Check(MD::szMapHfName("model.norm.weight") == "norm.scale", "final norm");
    Check(MD::szMapHfName("model.layers.7.self_attn.o_proj.weight") == "layers.7.attn.output_proj.weight", "o_proj");
    Check(MD::szMapHfName("model.layers.0.self_attn.k_proj.bias") == "layers.0.attn.k_proj.bias", "bias");
    Check(MD::szMapHfName("model.layers.12.mlp.gate_proj.weight") == "layers.12.mlp.w1.weight", "gate");
    Check(MD::szMapHfName("model.layers.12.mlp.down_proj.weight") == "layers.12.mlp.w2.weight", "down");
    Check(MD::szMapHfName("model.layers.3.input_layernorm.weight") == "layers.3.sa_norm.scale", "input norm");
    Check(MD::szMapHfName("model.layers.3.post_attention_layernorm.weight") == "layers.3.mlp_norm.scale",
          "post attention norm");
    Check(MD::szMapHfName("local_encoder.norm.scale") == "local_encoder.norm.scale", "native names pass");
}
// >>>s_end(names)

// <<<s_start(load)
// --- loading
TEST(safetensors_write_then_load) {
    auto tA = CTensor::Fill({2, 3}, 1.5f);
    auto tB = CTensor::Fill({4}, -2.0f);
    tA.fAt({1, 2}) = 7.0f;
    const std::string szPath = szTempPath("roundtrip.safetensors");
    UT::SError sErr;
    Check(MD::bWriteSafetensors(szPath, {{"a", &tA}, {"b", &tB}}, sErr), "write");

    auto tA2 = CTensor::Zeros({2, 3});
    auto tB2 = CTensor::Zeros({4});
    MD::CParamRegistry cReg;
    cReg.Add("a", tA2, MD::EOrigin::New);
    cReg.Add("b", tB2, MD::EOrigin::New);

    MD::SLoadReport sReport;
    bool bOk = MD::bLoadCheckpoint(sSpecFor(szPath), cReg, sReport, sErr);
    std::remove(szPath.c_str());

    Check(bOk, sErr.szFormat());
    Check(bTensorsEqual(tA, tA2) && bTensorsEqual(tB, tB2), "values survive");
    Check(sReport.vszLoaded.size() == 2 && sReport.vszMissing.empty(), "report");
}

TEST(safetensors_bf16_and_scalar) {
    // bf16 1.0 = 0x3f80, -2.0 = 0xc000, the gate is a scalar with shape []
    const std::string szHeader = R"({"w":{"dtype":"BF16","shape":[2],"data_offsets":[0,4]},)"
                                 R"("g":{"dtype":"F32","shape":[],"data_offsets":[4,8]}})";
    std::vector<uint8_t> vuData = {0x80, 0x3F, 0x00, 0xC0};
    float fGate = 0.25f;
    const uint8_t *puGate = reinterpret_cast<const uint8_t *>(&fGate);
    vuData.insert(vuData.end(), puGate, puGate + 4);

    const std::string szPath = szTempPath("bf16.safetensors");
    WriteRawSafetensors(szPath, szHeader, vuData);

    auto tW = CTensor::Zeros({2});
    auto tG = CTensor::Zeros({1});
    MD::CParamRegistry cReg;
    cReg.Add("w", tW, MD::EOrigin::Inherited);
    cReg.Add("g", tG, MD::EOrigin::New);

    MD::SLoadReport sReport;
    UT::SError sErr;
    bool bOk = MD::bLoadCheckpoint(sSpecFor(szPath), cReg, sReport, sErr);
    std::remove(szPath.c_str());

    Check(bOk, sErr.szFormat());
    CheckClose(tW.fFlat(0), 1.0f, 0.0f);
    CheckClose(tW.fFlat(1), -2.0f, 0.0f);
    CheckClose(tG.fFlat(0), 0.25f, 0.0f);
}

TEST(safetensors_rejects_dtype_and_shape) {
    const std::string szPath = szTempPath("bad.safetensors");
    auto tW = CTensor::Fill({2}, 3.0f);
    MD::CParamRegistry cReg;
    cReg.Add("w", tW, MD::EOrigin::New);
    MD::SLoadReport sReport;
    UT::SError sErr;

    WriteRawSafetensors(szPath, R"({"w":{"dtype":"I8","shape":[2],"data_offsets":[0,2]}})", {1, 2});
    Check(!MD::bLoadCheckpoint(sSpecFor(szPath), cReg, sReport, sErr), "int8 is not a weight dtype");
    Check(sErr.eCode == UT::EError::Configuration, "configuration error");
    Check(sErr.szWhat.find("I8") != std::string::npos, "names the dtype");

    auto tWide = CTensor::Fill({3}, 1.0f);
    Check(MD::bWriteSafetensors(szPath, {{"w", &tWide}}, sErr), "write");
    Check(!MD::bLoadCheckpoint(sSpecFor(szPath), cReg, sReport, sErr), "[3] into [2]");
    Check(sErr.szWhat.find("shape mismatch for 'w'") != std::string::npos, "names the tensor");
    std::remove(szPath.c_str());

    CheckClose(tW.fFlat(0), 3.0f, 0.0f);
}

TEST(safetensors_policy) {
    auto tKeep = CTensor::Fill({2}, 1.0f);
    auto tSkip = CTensor::Fill({2}, 2.0f);
    auto tExtra = CTensor::Fill({1}, 3.0f);
    const std::string szPath = szTempPath("policy.safetensors");
    UT::SError sErr;
    Check(MD::bWriteSafetensors(szPath, {{"keep", &tKeep}, {"output.weight", &tSkip}, {"extra", &tExtra}}, sErr),
          "write");

    auto tKeep2 = CTensor::Zeros({2});
    auto tOut2 = CTensor::Zeros({5});
    auto tLonely = CTensor::Zeros({2});
    MD::CParamRegistry cReg;
    cReg.Add("keep", tKeep2, MD::EOrigin::Inherited);
    cReg.Add("output.weight", tOut2, MD::EOrigin::New);
    cReg.Add("lonely", tLonely, MD::EOrigin::New);

    // default exclude list, the mismatched output head is never looked at
    MD::SCheckpointSpec sSpec;
    sSpec.vszFiles = {szPath};
    MD::SLoadReport sReport;
    Check(MD::bLoadCheckpoint(sSpec, cReg, sReport, sErr), sErr.szFormat());
    Check(sReport.vszLoaded == std::vector<std::string>({"keep"}), "loaded");
    Check(sReport.vszExcluded == std::vector<std::string>({"output.weight"}), "excluded");
    Check(sReport.vszUnexpected == std::vector<std::string>({"extra"}), "unexpected");
    Check(sReport.vszMissing == std::vector<std::string>({"lonely"}), "missing");
    CheckClose(tKeep2.fFlat(1), 1.0f, 0.0f);
    CheckClose(tOut2.fFlat(0), 0.0f, 0.0f);

    sSpec.bStrict = true;
    Check(!MD::bLoadCheckpoint(sSpec, cReg, sReport, sErr), "strict fails on missing + unexpected");
    Check(sErr.szWhat.find("lonely") != std::string::npos, "names the first missing tensor");

    sSpec.bStrict = false;
    sSpec.vszExclude.clear();
    Check(!MD::bLoadCheckpoint(sSpec, cReg, sReport, sErr), "without the exclusion the head shape fails");
    std::remove(szPath.c_str());

    sSpec.vszFiles.clear();
    sSpec.szDir = szTempPath("no_such_dir");
    Check(!MD::bLoadCheckpoint(sSpec, cReg, sReport, sErr), "missing directory");
}

TEST(safetensors_hf_names_and_dir_scan) {
    const std::string szDir = szTempPath("ckpt_dir");
    std::filesystem::create_directories(szDir);
    auto tNorm = CTensor::Fill({3}, 0.5f);
    auto tNorm2 = CTensor::Fill({3}, 9.0f);
    UT::SError sErr;
    Check(MD::bWriteSafetensors(szDir + "/model-00001.safetensors", {{"model.norm.weight", &tNorm}}, sErr), "a");
    Check(MD::bWriteSafetensors(szDir + "/model-00002.safetensors", {{"norm.scale", &tNorm2}}, sErr), "b");

    auto tDst = CTensor::Zeros({3});
    MD::CParamRegistry cReg;
    cReg.Add("norm.scale", tDst, MD::EOrigin::Inherited);

    MD::SCheckpointSpec sSpec;
    sSpec.szDir = szDir;
    MD::SLoadReport sReport;
    bool bOk = MD::bLoadCheckpoint(sSpec, cReg, sReport, sErr);
    std::filesystem::remove_all(szDir);

    Check(bOk, sErr.szFormat());
    CheckClose(tDst.fFlat(2), 0.5f, 0.0f);
    Check(sReport.vszLoaded.size() == 1, "first file wins on the duplicate");
}

TEST(save_params_by_origin) {
    auto tInh = CTensor::Fill({2}, 1.0f);
    auto tNew = CTensor::Fill({2}, 2.0f);
    MD::CParamRegistry cReg;
    cReg.Add("old", tInh, MD::EOrigin::Inherited);
    cReg.Add("fresh", tNew, MD::EOrigin::New);

    const std::string szPath = szTempPath("adapter.safetensors");
    UT::SError sErr;
    Check(MD::bSaveParams(szPath, cReg, MD::EOrigin::New, sErr), "save");

    MD::SLoadReport sReport;
    OP::FillInplace(tNew, 0.0f);
    Check(MD::bLoadCheckpoint(sSpecFor(szPath), cReg, sReport, sErr), "load back");
    std::remove(szPath.c_str());

    Check(sReport.vszLoaded == std::vector<std::string>({"fresh"}), "only new weights were saved");
    Check(sReport.vszMissing == std::vector<std::string>({"old"}), "inherited weights reported missing");
    CheckClose(tNew.fFlat(1), 2.0f, 0.0f);
}
// >>>s_end(load)
