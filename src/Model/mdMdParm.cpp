// Created by Unium on 05.03.26

#include "mdMdParm.hpp"
#include <cassert>

namespace MD {

auto szOriginName(EOrigin eOrigin) -> const char * { return eOrigin == EOrigin::New ? "new" : "inherited"; }

void CParamRegistry::Add(const std::string &szName, MT::CTensor &tTensor, EOrigin eOrigin) {
    if (tTensor.bEmpty())
        return;
    assert(m_mIndex.find(szName) == m_mIndex.end() && "[md:params] duplicate parameter name");

    m_mIndex[szName] = m_vParams.size();
    m_vParams.push_back({szName, &tTensor, eOrigin});
}

auto CParamRegistry::psFind(const std::string &szName) -> SParam * {
    auto it = m_mIndex.find(szName);
    return it == m_mIndex.end() ? nullptr : &m_vParams[it->second];
}

auto CParamRegistry::psFind(const std::string &szName) const -> const SParam * {
    auto it = m_mIndex.find(szName);
    return it == m_mIndex.end() ? nullptr : &m_vParams[it->second];
}

auto CParamRegistry::vszNames(EOrigin eOrigin) const -> std::vector<std::string> {
    std::vector<std::string> vszOut;
    for (const auto &sP : m_vParams) {
        if (sP.eOrigin == eOrigin)
            vszOut.push_back(sP.szName);
    }
    return vszOut;
}

auto CParamRegistry::lNumel(EOrigin eOrigin) const -> int64_t {
    int64_t lN = 0;
    for (const auto &sP : m_vParams) {
        if (sP.eOrigin == eOrigin)
            lN += sP.ptTensor->lNumel();
    }
    return lN;
}

void CParamRegistry::Clear() {
    m_vParams.clear();
    m_mIndex.clear();
}

void AddBlockParams(CParamRegistry &sReg, const std::string &szPrefix, SBlockWeights &sW, EOrigin eOrigin) {
    sReg.Add(szPrefix + "sa_norm.scale", sW.tSaNorm, eOrigin);
    sReg.Add(szPrefix + "attn.q_proj.weight", sW.tWq, eOrigin);
    sReg.Add(szPrefix + "attn.q_proj.bias", sW.tBq, eOrigin);
    sReg.Add(szPrefix + "attn.k_proj.weight", sW.tWk, eOrigin);
    sReg.Add(szPrefix + "attn.k_proj.bias", sW.tBk, eOrigin);
    sReg.Add(szPrefix + "attn.v_proj.weight", sW.tWv, eOrigin);
    sReg.Add(szPrefix + "attn.v_proj.bias", sW.tBv, eOrigin);
    sReg.Add(szPrefix + "attn.output_proj.weight", sW.tWo, eOrigin);
    sReg.Add(szPrefix + "mlp_norm.scale", sW.tMlpNorm, eOrigin);
    sReg.Add(szPrefix + "mlp.w1.weight", sW.tW1, eOrigin);
    sReg.Add(szPrefix + "mlp.w2.weight", sW.tW2, eOrigin);
    sReg.Add(szPrefix + "mlp.w3.weight", sW.tW3, eOrigin);
}
} // namespace MD
