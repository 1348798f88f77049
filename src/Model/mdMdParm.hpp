// Created by Unium on 05.03.26

#pragma once

#include "../Tensor/mtTnTnsr.hpp"
#include "mdMdBlck.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace MD {
// Inherited = came with the pretrained decoder, New = added by the byte front end
enum class EOrigin { Inherited, New };

auto szOriginName(EOrigin eOrigin) -> const char *;

struct SParam {
    std::string szName;
    MT::CTensor *ptTensor = nullptr;
    EOrigin eOrigin = EOrigin::New;
};

/*---------------------------------------------------------
 * FN: CParamRegistry
 * DESC: flat name -> tensor map over every weight of the
 *       model, in registration order. the tensors stay owned
 *       by their modules, the registry only points at them
 * AUTH: unium (05.03.26)
 *-------------------------------------------------------*/
class CParamRegistry {
public:
    /*---------------------------------------------------------
     * FN: Add
     * DESC: registers a tensor under szName. empty tensors
     *       (absent biases) are skipped
     * PARMS: szName (checkpoint key), tTensor (owned elsewhere),
     *        eOrigin (new or inherited)
     * AUTH: unium (05.03.26)
     *-------------------------------------------------------*/
    void Add(const std::string &szName, MT::CTensor &tTensor, EOrigin eOrigin);

    auto psFind(const std::string &szName) -> SParam *;
    auto psFind(const std::string &szName) const -> const SParam *;

    auto vParams() const -> const std::vector<SParam> & { return m_vParams; }
    auto vszNames(EOrigin eOrigin) const -> std::vector<std::string>;
    auto lNumel(EOrigin eOrigin) const -> int64_t;
    auto iCount() const -> int32_t { return (int32_t)m_vParams.size(); }

    void Clear();

private:
    std::vector<SParam> m_vParams;
    std::unordered_map<std::string, size_t> m_mIndex;
};

/*---------------------------------------------------------
 * FN: AddBlockParams
 * DESC: registers one block under szPrefix ("layers.3.")
 *       with the torchtune sub names (attn.q_proj.weight ...)
 * PARMS: sReg (registry), szPrefix, sW (block weights),
 *        eOrigin
 * AUTH: unium (05.03.26)
 *-------------------------------------------------------*/
void AddBlockParams(CParamRegistry &sReg, const std::string &szPrefix, SBlockWeights &sW, EOrigin eOrigin);
} // namespace MD
