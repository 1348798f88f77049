// Created by Unium on 24.02.26

#include "mdMdLoad.hpp"
#include "../Thread/mtThPool.hpp"
#include "../Util/utUtJson.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unordered_map>
#include <unordered_set>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
namespace MD {

// <<<s_start(mmap)
// --- memory-mapped file
/*---------------------------------------------------------
 * FN: SMappedFile
 * DESC: raii wrapper for mm file io to avoid copying entire
 *       saftetensor thing into ram
 * AUTH: unium (25.02.26 R: 11.03.26)
 *-------------------------------------------------------*/
struct SMappedFile {
    const uint8_t *pData = nullptr;
    int64_t lSize = 0;
    int iFd = -1;

    SMappedFile() = default;
    SMappedFile(const SMappedFile &) = delete;
    SMappedFile &operator=(const SMappedFile &) = delete;

    ~SMappedFile() { Close(); }

    void Close() {
        if (pData && lSize > 0)
            munmap(const_cast<uint8_t *>(pData), lSize);
        pData = nullptr;
        if (iFd >= 0) {
            close(iFd);
            iFd = -1;
        }
        lSize = 0;
    }

    auto bOpen(const std::string &szPath) -> bool {
        iFd = open(szPath.c_str(), O_RDONLY);
        if (iFd < 0)
            return false;

        struct stat st;
        if (fstat(iFd, &st) != 0 || st.st_size <= 0) {
            Close();
            return false;
        }
        lSize = st.st_size;

        void *pMapped = mmap(nullptr, lSize, PROT_READ, MAP_PRIVATE, iFd, 0);
        if (pMapped == MAP_FAILED) {
            lSize = 0;
            Close();
            return false;
        }

        madvise(pMapped, lSize, MADV_SEQUENTIAL);
        pData = (const uint8_t *)pMapped;
        return true;
    }
};
// >>>s_end(mmap)

// <<<s_start(safetensors)
// --- safetensors header
struct SSafeTensorInfo {
    std::string szDtype;
    std::vector<int64_t> vlShape;
    int64_t lDataStart = 0;
    int64_t lDataEnd = 0;
};

/*---------------------------------------------------------
 * FN: ParseTensorInfo
 * DESC: parses a single tensors info object from the header
 * PARMS: szJson, lPos (in/out)
 * AUTH: unium (24.02.26)
 *-------------------------------------------------------*/
static auto ParseTensorInfo(const std::string &szJson, size_t &lPos) -> SSafeTensorInfo {
    SSafeTensorInfo sInfo;

    UT::SkipWs(szJson, lPos);
    if (lPos >= szJson.size() || szJson[lPos] != '{')
        return sInfo;
    lPos++;

    while (lPos < szJson.size() && szJson[lPos] != '}') {
        UT::SkipWs(szJson, lPos);
        if (szJson[lPos] == '}')
            break;
        if (szJson[lPos] == ',') {
            lPos++;
            continue;
        }

        std::string szFieldKey = UT::szParseJsonString(szJson, lPos);
        UT::SkipWs(szJson, lPos);
        if (lPos < szJson.size() && szJson[lPos] == ':')
            lPos++;
        UT::SkipWs(szJson, lPos);

        if (szFieldKey == "dtype") {
            sInfo.szDtype = UT::szParseJsonString(szJson, lPos);
        } else if (szFieldKey == "shape" || szFieldKey == "data_offsets") {
            std::vector<int64_t> vlNums;
            if (lPos < szJson.size() && szJson[lPos] == '[') {
                lPos++;
                while (lPos < szJson.size() && szJson[lPos] != ']') {
                    UT::SkipWs(szJson, lPos);
                    if (szJson[lPos] == ',') {
                        lPos++;
                        continue;
                    }
                    if (szJson[lPos] == ']')
                        break;
                    size_t lBefore = lPos;
                    vlNums.push_back(UT::lParseJsonNumber(szJson, lPos));
                    // not a number, step over it so the loop always advances
                    if (lPos == lBefore) {
                        UT::SkipJsonValue(szJson, lPos);
                        if (lPos == lBefore)
                            lPos++;
                    }
                }
                if (lPos < szJson.size())
                    lPos++;
            }
            if (szFieldKey == "shape") {
                sInfo.vlShape = vlNums;
            } else if (vlNums.size() == 2) {
                sInfo.lDataStart = vlNums[0];
                sInfo.lDataEnd = vlNums[1];
            }
        } else {
            UT::SkipJsonValue(szJson, lPos);
        }
    }
    if (lPos < szJson.size())
        lPos++;

    return sInfo;
}

/*---------------------------------------------------------
 * FN: ParseSafetensorsHeader
 * DESC: parses the full safetensors json header, header
 *       order is kept so reports are stable
 * PARMS: szHeader (json header text)
 * AUTH: unium (24.02.26 R: 11.03.26)
 *-------------------------------------------------------*/
static auto ParseSafetensorsHeader(const std::string &szHeader)
    -> std::vector<std::pair<std::string, SSafeTensorInfo>> {
    std::vector<std::pair<std::string, SSafeTensorInfo>> vTensors;
    size_t lPos = 0;

    UT::SkipWs(szHeader, lPos);
    if (lPos >= szHeader.size() || szHeader[lPos] != '{')
        return vTensors;
    lPos++;

    while (lPos < szHeader.size() && szHeader[lPos] != '}') {
        UT::SkipWs(szHeader, lPos);
        if (szHeader[lPos] == '}')
            break;
        if (szHeader[lPos] == ',') {
            lPos++;
            continue;
        }

        std::string szTensorName = UT::szParseJsonString(szHeader, lPos);
        UT::SkipWs(szHeader, lPos);
        if (lPos < szHeader.size() && szHeader[lPos] == ':')
            lPos++;
        UT::SkipWs(szHeader, lPos);

        if (szTensorName == "__metadata__") {
            UT::SkipJsonValue(szHeader, lPos);
            continue;
        }

        vTensors.emplace_back(szTensorName, ParseTensorInfo(szHeader, lPos));
    }

    return vTensors;
}
// >>>s_end(safetensors)

// <<<s_start(dtype)
// --- dtype conversion
static auto iDtypeSize(const std::string &szDtype) -> int32_t {
    if (szDtype == "F32")
        return 4;
    if (szDtype == "BF16" || szDtype == "F16")
        return 2;
    return 0;
}

/*---------------------------------------------------------
 * FN: fFP16ToF32
 * DESC: converts a single float16 value to float32
 * PARMS: u16 (raw float16 bits)
 * AUTH: unium (24.02.26)
 *-------------------------------------------------------*/
static inline auto fFP16ToF32(uint16_t u16) -> float {
    uint32_t iSign = (u16 >> 15) & 0x1;
    uint32_t iExp = (u16 >> 10) & 0x1F;
    uint32_t iMant = u16 & 0x3FF;

    if (iExp == 0) {
        if (iMant == 0) {
            uint32_t u32 = iSign << 31;
            float fVal;
            std::memcpy(&fVal, &u32, sizeof(float));
            return fVal;
        }
        float fVal = std::ldexp((float)iMant, -24);
        return iSign ? -fVal : fVal;
    }

    if (iExp == 0x1F) {
        uint32_t u32 = (iSign << 31) | 0x7F800000 | (iMant << 13);
        float fVal;
        std::memcpy(&fVal, &u32, sizeof(float));
        return fVal;
    }

    uint32_t u32 = (iSign << 31) | ((iExp - 15 + 127) << 23) | (iMant << 13);
    float fVal;
    std::memcpy(&fVal, &u32, sizeof(float));
    return fVal;
}

/*---------------------------------------------------------
 * FN: DecodeInto
 * DESC: widens mmapd tensor data into an existing f32 buffer,
 *       split across the pool. dtype was checked by the caller
 * PARMS: pfDst (destination), pSrc (tensor bytes), szDtype,
 *        lNumel
 * AUTH: unium (24.02.26 R: 11.03.26)
 *-------------------------------------------------------*/
static void DecodeInto(float *pfDst, const uint8_t *pSrc, const std::string &szDtype, int64_t lNumel) {
    if (szDtype == "F32") {
        std::memcpy(pfDst, pSrc, lNumel * sizeof(float));
    } else if (szDtype == "BF16") {
        MT::TH::ParFor(lNumel, [pfDst, pSrc](int64_t lStart, int64_t lEnd) {
            for (int64_t i = lStart; i < lEnd; i++) {
                uint16_t u16;
                std::memcpy(&u16, pSrc + 2 * i, 2);
                uint32_t u32 = (uint32_t)u16 << 16;
                std::memcpy(&pfDst[i], &u32, sizeof(float));
            }
        });
    } else {
        MT::TH::ParFor(lNumel, [pfDst, pSrc](int64_t lStart, int64_t lEnd) {
            for (int64_t i = lStart; i < lEnd; i++) {
                uint16_t u16;
                std::memcpy(&u16, pSrc + 2 * i, 2);
                pfDst[i] = fFP16ToF32(u16);
            }
        });
    }
}
// >>>s_end(dtype)

// <<<s_start(fileload)
// --- safetensors file loading with mmap
struct SSafetensorsFile {
    std::string szPath;
    std::vector<std::pair<std::string, SSafeTensorInfo>> vTensors;
    SMappedFile sMmap;
    const uint8_t *pDataSection = nullptr;
    int64_t lDataSize = 0;
};

/*---------------------------------------------------------
 * FN: bOpenSafetensorsFile
 * DESC: maps and parses a single .safetensors file
 * PARMS: szPath (file path), sFile (output), sErr (status)
 * AUTH: unium (24.02.26 R: 11.03.26)
 *-------------------------------------------------------*/
static auto bOpenSafetensorsFile(const std::string &szPath, SSafetensorsFile &sFile, UT::SError &sErr) -> bool {
    sFile.szPath = szPath;
    if (!sFile.sMmap.bOpen(szPath))
        return UT::bFail(sErr, UT::EError::Configuration, "cannot mmap " + szPath);

    if (sFile.sMmap.lSize < 8)
        return UT::bFail(sErr, UT::EError::Configuration, "file too small " + szPath);

    uint64_t lHeaderSize = 0;
    std::memcpy(&lHeaderSize, sFile.sMmap.pData, 8);

    if (lHeaderSize > 100 * 1024 * 1024)
        return UT::bFail(sErr, UT::EError::Configuration,
                         "header too large (" + std::to_string(lHeaderSize) + " bytes) in " + szPath);
    if ((int64_t)(8 + lHeaderSize) > sFile.sMmap.lSize)
        return UT::bFail(sErr, UT::EError::Configuration, "header exceeds file size in " + szPath);

    std::string szHeader((const char *)(sFile.sMmap.pData + 8), lHeaderSize);
    sFile.vTensors = ParseSafetensorsHeader(szHeader);

    sFile.pDataSection = sFile.sMmap.pData + 8 + lHeaderSize;
    sFile.lDataSize = sFile.sMmap.lSize - 8 - (int64_t)lHeaderSize;

    std::cout << "  mmap'd " << szPath << " (" << sFile.vTensors.size() << " tensors, "
              << (sFile.lDataSize / (1024 * 1024)) << " MB data)" << std::endl;
    return true;
}

static auto bResolveFiles(const SCheckpointSpec &sSpec, std::vector<std::string> &vszOut, UT::SError &sErr)
    -> bool {
    vszOut.clear();
    if (!sSpec.vszFiles.empty()) {
        for (const auto &szFile : sSpec.vszFiles) {
            fs::path pFile(szFile);
            if (pFile.is_relative() && !sSpec.szDir.empty())
                pFile = fs::path(sSpec.szDir) / pFile;
            vszOut.push_back(pFile.string());
        }
        return true;
    }

    std::error_code ec;
    if (!fs::is_directory(sSpec.szDir, ec))
        return UT::bFail(sErr, UT::EError::Configuration, "checkpoint dir '" + sSpec.szDir + "' does not exist");

    for (const auto &entry : fs::directory_iterator(sSpec.szDir, ec)) {
        if (entry.path().extension() == ".safetensors")
            vszOut.push_back(entry.path().string());
    }
    if (vszOut.empty())
        return UT::bFail(sErr, UT::EError::Configuration, "no .safetensors files found in " + sSpec.szDir);

    std::sort(vszOut.begin(), vszOut.end());
    return true;
}
// >>>s_end(fileload)

// <<<s_start(weightmap)
// --- weight name mapping
auto szMapHfName(const std::string &szName) -> std::string {
    if (szName == "model.embed_tokens.weight")
        return "tok_embeddings.weight";
    if (szName == "model.norm.weight")
        return "norm.scale";
    if (szName == "lm_head.weight")
        return "output.weight";

    static const std::string szLayers = "model.layers.";
    if (szName.compare(0, szLayers.size(), szLayers) != 0)
        return szName;

    // model.layers.{i}.{rest}
    size_t lDot = szName.find('.', szLayers.size());
    if (lDot == std::string::npos)
        return szName;
    std::string szIdx = szName.substr(szLayers.size(), lDot - szLayers.size());
    std::string szRest = szName.substr(lDot + 1);

    static const std::pair<const char *, const char *> aMap[] = {
        {"self_attn.q_proj.", "attn.q_proj."},
        {"self_attn.k_proj.", "attn.k_proj."},
        {"self_attn.v_proj.", "attn.v_proj."},
        {"self_attn.o_proj.", "attn.output_proj."},
        {"mlp.gate_proj.", "mlp.w1."},
        {"mlp.down_proj.", "mlp.w2."},
        {"mlp.up_proj.", "mlp.w3."},
    };

    if (szRest == "input_layernorm.weight")
        szRest = "sa_norm.scale";
    else if (szRest == "post_attention_layernorm.weight")
        szRest = "mlp_norm.scale";
    else {
        for (const auto &sPair : aMap) {
            size_t lLen = std::strlen(sPair.first);
            if (szRest.compare(0, lLen, sPair.first) == 0) {
                szRest = std::string(sPair.second) + szRest.substr(lLen);
                break;
            }
        }
    }
    return "layers." + szIdx + "." + szRest;
}
// >>>s_end(weightmap)

// <<<s_start(api)
// --- public api
auto bLoadCheckpoint(const SCheckpointSpec &sSpec, CParamRegistry &sReg, SLoadReport &sReport, UT::SError &sErr)
    -> bool {
    sReport = SLoadReport();

    std::vector<std::string> vszPaths;
    if (!bResolveFiles(sSpec, vszPaths, sErr))
        return false;
    std::cout << "  loading checkpoint: " << vszPaths.size() << " safetensors file(s)"
              << (sSpec.bStrict ? " (strict)" : "") << std::endl;

    std::vector<SSafetensorsFile> vFiles(vszPaths.size());
    for (size_t i = 0; i < vszPaths.size(); i++) {
        if (!bOpenSafetensorsFile(vszPaths[i], vFiles[i], sErr))
            return false;
    }

    std::unordered_set<std::string> setExclude(sSpec.vszExclude.begin(), sSpec.vszExclude.end());

    struct SPlanned {
        SParam *psParam;
        const SSafetensorsFile *psFile;
        const SSafeTensorInfo *psInfo;
    };
    std::vector<SPlanned> vPlan;
    std::unordered_set<std::string> setSeen;

    // pass 1: match and check everything, nothing is written yet
    for (const auto &sFile : vFiles) {
        for (const auto &sEntry : sFile.vTensors) {
            const std::string &szRaw = sEntry.first;
            const SSafeTensorInfo &sInfo = sEntry.second;
            std::string szName = szMapHfName(szRaw);

            // first file wins on duplicates
            if (!setSeen.insert(szName).second)
                continue;

            if (setExclude.count(szName) || setExclude.count(szRaw)) {
                sReport.vszExcluded.push_back(szName);
                continue;
            }

            SParam *psParam = sReg.psFind(szName);
            if (psParam == nullptr) {
                sReport.vszUnexpected.push_back(szName);
                continue;
            }

            int32_t iSize = iDtypeSize(sInfo.szDtype);
            if (iSize == 0)
                return UT::bFail(sErr, UT::EError::Configuration,
                                 "tensor '" + szRaw + "' has unsupported dtype '" + sInfo.szDtype + "'");

            // scalars come as shape [], the registry holds them as [1]
            std::vector<int64_t> vlShape = sInfo.vlShape;
            if (vlShape.empty())
                vlShape.push_back(1);
            if (!psParam->ptTensor->bSameShape(vlShape))
                return UT::bFail(sErr, UT::EError::Configuration,
                                 "shape mismatch for '" + szName + "': checkpoint " + MT::szShapeOf(vlShape) +
                                     " vs model " + psParam->ptTensor->szShape());

            const int64_t lBytes = psParam->ptTensor->lNumel() * iSize;
            if (sInfo.lDataStart < 0 || sInfo.lDataEnd - sInfo.lDataStart != lBytes ||
                sInfo.lDataEnd > sFile.lDataSize)
                return UT::bFail(sErr, UT::EError::Configuration,
                                 "tensor '" + szRaw + "' has bad data_offsets in " + sFile.szPath);

            vPlan.push_back({psParam, &sFile, &sInfo});
        }
    }

    for (const auto &sP : sReg.vParams()) {
        if (!setSeen.count(sP.szName) && !setExclude.count(sP.szName))
            sReport.vszMissing.push_back(sP.szName);
    }

    if (sSpec.bStrict && (!sReport.vszMissing.empty() || !sReport.vszUnexpected.empty())) {
        std::string szFirst =
            !sReport.vszMissing.empty() ? "missing '" + sReport.vszMissing[0] + "'"
                                        : "unexpected '" + sReport.vszUnexpected[0] + "'";
        return UT::bFail(sErr, UT::EError::Configuration,
                         "strict load: " + std::to_string(sReport.vszMissing.size()) + " missing, " +
                             std::to_string(sReport.vszUnexpected.size()) + " unexpected (first " + szFirst + ")");
    }

    // pass 2: copy
    for (const auto &sP : vPlan) {
        DecodeInto(sP.psParam->ptTensor->pfData(), sP.psFile->pDataSection + sP.psInfo->lDataStart,
                   sP.psInfo->szDtype, sP.psParam->ptTensor->lNumel());
        sReport.vszLoaded.push_back(sP.psParam->szName);
    }

    std::cout << "  loaded " << sReport.vszLoaded.size() << " tensors (" << sReport.vszMissing.size()
              << " missing, " << sReport.vszUnexpected.size() << " unexpected, " << sReport.vszExcluded.size()
              << " excluded)" << std::endl;
    return true;
}

auto bWriteSafetensors(const std::string &szPath,
                       const std::vector<std::pair<std::string, const MT::CTensor *>> &vTensors, UT::SError &sErr)
    -> bool {
    std::string szHeader = "{\"__metadata__\":{\"format\":\"pt\"}";
    int64_t lOffset = 0;
    for (const auto &sEntry : vTensors) {
        const MT::CTensor &t = *sEntry.second;
        const int64_t lBytes = t.lNumel() * (int64_t)sizeof(float);

        szHeader += "," + UT::szJsonEscape(sEntry.first) + ":{\"dtype\":\"F32\",\"shape\":[";
        for (int d = 0; d < t.m_iNdim; d++) {
            if (d > 0)
                szHeader += ",";
            szHeader += std::to_string(t.m_lShape[d]);
        }
        szHeader += "],\"data_offsets\":[" + std::to_string(lOffset) + "," + std::to_string(lOffset + lBytes) + "]}";
        lOffset += lBytes;
    }
    szHeader += "}";
    // data section starts 8 byte aligned
    while (szHeader.size() % 8 != 0)
        szHeader += ' ';

    std::ofstream ofs(szPath, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open())
        return UT::bFail(sErr, UT::EError::Configuration, "cannot open " + szPath + " for writing");

    uint64_t lHeaderSize = szHeader.size();
    ofs.write(reinterpret_cast<const char *>(&lHeaderSize), 8);
    ofs.write(szHeader.data(), (std::streamsize)szHeader.size());

    for (const auto &sEntry : vTensors) {
        const MT::CTensor &t = *sEntry.second;
        if (t.bIsContiguous()) {
            ofs.write(reinterpret_cast<const char *>(t.pfData()), t.lNumel() * sizeof(float));
        } else {
            MT::CTensor tDense = t.Clone();
            ofs.write(reinterpret_cast<const char *>(tDense.pfData()), tDense.lNumel() * sizeof(float));
        }
    }

    if (!ofs.good())
        return UT::bFail(sErr, UT::EError::Configuration, "write failed for " + szPath);

    std::cout << "  wrote " << vTensors.size() << " tensors to " << szPath << " (" << (lOffset / 1024) << " KB)"
              << std::endl;
    return true;
}

auto bSaveParams(const std::string &szPath, const CParamRegistry &sReg, EOrigin eOrigin, UT::SError &sErr) -> bool {
    std::vector<std::pair<std::string, const MT::CTensor *>> vTensors;
    for (const auto &sP : sReg.vParams()) {
        if (sP.eOrigin == eOrigin)
            vTensors.emplace_back(sP.szName, sP.ptTensor);
    }
    return bWriteSafetensors(szPath, vTensors, sErr);
}

/*---------------------------------------------------------
 * FN: PrintLoadReport
 * DESC: prints what a load did, lists are cut at a few names
 * PARMS: sReport (load report)
 * AUTH: unium (11.03.26)
 *-------------------------------------------------------*/
void PrintLoadReport(const SLoadReport &sReport) {
    auto PrintList = [](const char *szLabel, const std::vector<std::string> &vszNames) {
        if (vszNames.empty())
            return;
        std::cout << "  " << szLabel << " (" << vszNames.size() << "):";
        const size_t lShown = std::min<size_t>(vszNames.size(), 4);
        for (size_t i = 0; i < lShown; i++)
            std::cout << " " << vszNames[i];
        if (vszNames.size() > lShown)
            std::cout << " ...";
        std::cout << std::endl;
    };

    std::cout << "--- load report" << std::endl;
    std::cout << "  loaded: " << sReport.vszLoaded.size() << std::endl;
    PrintList("missing", sReport.vszMissing);
    PrintList("unexpected", sReport.vszUnexpected);
    PrintList("excluded", sReport.vszExcluded);
}
// >>>s_end(api)
} // namespace MD
