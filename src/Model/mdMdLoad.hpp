// Created by Unium on 24.02.26

#pragma once

#include "../Tensor/mtTnTnsr.hpp"
#include "../Util/utUtErr_.hpp"
#include "mdMdParm.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace MD {
/*---------------------------------------------------------
 * FN: SCheckpointSpec
 * DESC: where to load from and how forgiving to be. files are
 *       relative to szDir unless absolute, an empty list means
 *       every *.safetensors in szDir
 * AUTH: unium (11.03.26)
 *-------------------------------------------------------*/
struct SCheckpointSpec {
    std::string szDir;
    std::vector<std::string> vszFiles;
    bool bStrict = false;
    // never read into the model, matched after hf name mapping
    std::vector<std::string> vszExclude = {"tok_embeddings.weight", "output.weight"};
};

struct SLoadReport {
    std::vector<std::string> vszLoaded;
    std::vector<std::string> vszMissing;    // in the model, not in the checkpoint
    std::vector<std::string> vszUnexpected; // in the checkpoint, not in the model
    std::vector<std::string> vszExcluded;   // in the checkpoint, skipped on purpose
};

/*---------------------------------------------------------
 * FN: szMapHfName
 * DESC: maps a hugging face qwen2 tensor name onto the
 *       torchtune name the registry uses
 *       (model.layers.3.self_attn.o_proj.weight ->
 *       layers.3.attn.output_proj.weight). names that are
 *       not hf style come back unchanged
 * PARMS: szName (checkpoint key)
 * AUTH: unium (11.03.26)
 *-------------------------------------------------------*/
auto szMapHfName(const std::string &szName) -> std::string;

/*---------------------------------------------------------
 * FN: bLoadCheckpoint
 * DESC: copies checkpoint tensors into the registry tensors.
 *       excluded names are skipped, a shape mismatch or an
 *       unsupported dtype fails before anything is written.
 *       strict mode also fails on missing or unexpected names
 * PARMS: sSpec (files + policy), sReg (destination),
 *        sReport (what happened), sErr (status)
 * AUTH: unium (24.02.26 R: 11.03.26)
 *-------------------------------------------------------*/
auto bLoadCheckpoint(const SCheckpointSpec &sSpec, CParamRegistry &sReg, SLoadReport &sReport, UT::SError &sErr)
    -> bool;

/*---------------------------------------------------------
 * FN: bWriteSafetensors
 * DESC: writes f32 tensors into one .safetensors file in the
 *       given order
 * PARMS: szPath (output file), vTensors (name, tensor) pairs,
 *        sErr (status)
 * AUTH: unium (11.03.26)
 *-------------------------------------------------------*/
auto bWriteSafetensors(const std::string &szPath,
                       const std::vector<std::pair<std::string, const MT::CTensor *>> &vTensors, UT::SError &sErr)
    -> bool;

// every registry tensor of one origin, e.g. the new weights into adapter_model.safetensors
auto bSaveParams(const std::string &szPath, const CParamRegistry &sReg, EOrigin eOrigin, UT::SError &sErr) -> bool;

void PrintLoadReport(const SLoadReport &sReport);
} // namespace MD
