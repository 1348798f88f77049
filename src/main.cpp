// Created by Unium on 26.02.26

#include "Generate/gnGnLoop.hpp"
#include "Latent/blLtConf.hpp"
#include "Latent/blLtModl.hpp"
#include "Model/mdMdConf.hpp"
#include "Model/mdMdLoad.hpp"
#include "Tokenizer/tkTkByte.hpp"
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

// <<<s_start(helpers)
// --- cli helpers
/*---------------------------------------------------------
 * FN: PrintUsage
 * DESC: prints usage info to stdout
 * PARMS: szProgName (argv[0])
 * AUTH: unium (26.02.26 R: 13.03.26)
 *-------------------------------------------------------*/
static void PrintUsage(const char *szProgName) {
    std::cout << "usage:" << std::endl;
    std::cout << "  " << szProgName << " <model_dir> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "  model_dir holds the qwen2 config.json and *.safetensors" << std::endl;
    std::cout << std::endl;
    std::cout << "options:" << std::endl;
    std::cout << "  --blt-config <path>     byte front end config (default: <model_dir>/blt_config.json)" << std::endl;
    std::cout << "  --max-new-bytes <int>   bytes to generate (default: 20)" << std::endl;
    std::cout << "  --temp <float>          temperature, 0 = greedy (default: 0.7)" << std::endl;
    std::cout << "  --top-k <int>           top-k (default: 50)" << std::endl;
    std::cout << "  --seed <int>            sampling seed (default: 1234)" << std::endl;
    std::cout << "  --init-seed <int>       seed for the new weights (default: 42)" << std::endl;
    std::cout << "  --kv-cache              reuse decoder keys/values between steps" << std::endl;
    std::cout << "  --no-utf8               do not constrain sampling to valid utf-8" << std::endl;
    std::cout << "  --strict                fail on missing or unexpected checkpoint tensors" << std::endl;
    std::cout << "  --exclude <name>        never load this tensor (repeatable, replaces the defaults)" << std::endl;
    std::cout << "  --no-exclude            load every matching tensor" << std::endl;
    std::cout << "  --adapter <file>        restore new weights saved with --save-adapter" << std::endl;
    std::cout << "  --save-adapter <file>   write the new weights after loading" << std::endl;
    std::cout << "  --random                skip the pretrained checkpoint" << std::endl;
    std::cout << "  --prompt <string>       generate once and exit" << std::endl;
}

static auto bParseInt(const char *sz, int32_t &iOut) -> bool {
    char *pEnd = nullptr;
    long l = std::strtol(sz, &pEnd, 10);
    if (pEnd == sz || *pEnd != '\0')
        return false;
    iOut = (int32_t)l;
    return true;
}

static auto bParseFloat(const char *sz, float &fOut) -> bool {
    char *pEnd = nullptr;
    float f = std::strtof(sz, &pEnd);
    if (pEnd == sz || *pEnd != '\0')
        return false;
    fOut = f;
    return true;
}
// >>>s_end(helpers)

// <<<s_start(generate)
// --- generation
/*---------------------------------------------------------
 * FN: bGenerateStreaming
 * DESC: runs GN::bGenerate and prints every character as soon
 *       as its last byte is out
 * PARMS: sModel (built model), tok (tokenizer), szPrompt,
 *        sCfg (sampling), sResult (out), sErr (status)
 * AUTH: unium (26.02.26 R: 20.03.26)
 *-------------------------------------------------------*/
static auto bGenerateStreaming(BL::CByteLatentModel &sModel, const TK::CByteTokenizer &tok,
                               const std::string &szPrompt, const GN::SGenConfig &sCfg, GN::SGenResult &sResult,
                               UT::SError &sErr) -> bool {
    TK::SUtf8State sUtf8;
    std::string szPending;

    bool bOk = GN::bGenerate(sModel, tok, szPrompt, sCfg, sResult, sErr, [&](uint8_t uByte) {
        // unconstrained runs can emit junk, start over instead of holding it forever
        if (!sUtf8.bAllows(uByte))
            sUtf8 = TK::SUtf8State();
        sUtf8.Push(uByte);
        szPending += (char)uByte;
        if (sUtf8.bAtBoundary()) {
            std::cout << szPending << std::flush;
            szPending.clear();
        }
    });
    std::cout << szPending << std::endl;
    return bOk;
}

static void PrintGenStats(const GN::SGenResult &sResult) {
    std::cout << "  [" << sResult.viBytes.size() << " bytes, " << std::fixed << std::setprecision(0)
              << sResult.dFirstMs << " ms first, " << sResult.dTotalMs << " ms total, " << std::setprecision(1)
              << sResult.dBytesPerSec << " bytes/s, stop=" << GN::szStepResultName(sResult.eStop) << "]"
              << std::endl;
}
// >>>s_end(generate)

// <<<s_start(main)
// --- entry point
/*---------------------------------------------------------
 * FN: main
 * DESC: builds the byte latent model over a pretrained qwen2
 *       checkpoint, then generates from --prompt or from an
 *       interactive loop
 * PARMS: argc, argv
 * AUTH: unium (26.02.26 R: 13.03.26)
 *-------------------------------------------------------*/
int main(int argc, char *argv[]) {
    if (argc < 2 || std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h") {
        PrintUsage(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    std::string szModelDir = argv[1];
    std::string szBltConfig = szModelDir + "/blt_config.json";
    bool bExplicitBltConfig = false;
    std::string szAdapterIn;
    std::string szAdapterOut;
    std::string szPrompt;
    bool bOneShot = false;
    bool bRandom = false;
    bool bStrict = false;
    bool bExcludeSet = false;
    std::vector<std::string> vszExclude;
    int32_t iInitSeed = 42;

    GN::SGenConfig sGen;

    for (int i = 2; i < argc; i++) {
        std::string szArg = argv[i];
        bool bOk = true;

        if (szArg == "--blt-config" && i + 1 < argc) {
            szBltConfig = argv[++i];
            bExplicitBltConfig = true;
        } else if (szArg == "--max-new-bytes" && i + 1 < argc) {
            bOk = bParseInt(argv[++i], sGen.iMaxNewBytes);
        } else if (szArg == "--temp" && i + 1 < argc) {
            bOk = bParseFloat(argv[++i], sGen.fTemperature);
        } else if (szArg == "--top-k" && i + 1 < argc) {
            bOk = bParseInt(argv[++i], sGen.iTopK);
        } else if (szArg == "--seed" && i + 1 < argc) {
            int32_t iSeed = 0;
            bOk = bParseInt(argv[++i], iSeed);
            sGen.uSeed = (uint64_t)(uint32_t)iSeed;
        } else if (szArg == "--init-seed" && i + 1 < argc) {
            bOk = bParseInt(argv[++i], iInitSeed);
        } else if (szArg == "--kv-cache") {
            sGen.bKvCache = true;
        } else if (szArg == "--no-utf8") {
            sGen.bUtf8Constrain = false;
        } else if (szArg == "--strict") {
            bStrict = true;
        } else if (szArg == "--exclude" && i + 1 < argc) {
            vszExclude.push_back(argv[++i]);
            bExcludeSet = true;
        } else if (szArg == "--no-exclude") {
            vszExclude.clear();
            bExcludeSet = true;
        } else if (szArg == "--adapter" && i + 1 < argc) {
            szAdapterIn = argv[++i];
        } else if (szArg == "--save-adapter" && i + 1 < argc) {
            szAdapterOut = argv[++i];
        } else if (szArg == "--random") {
            bRandom = true;
        } else if (szArg == "--prompt" && i + 1 < argc) {
            szPrompt = argv[++i];
            bOneShot = true;
        } else {
            std::cerr << "  error: unknown or incomplete option " << szArg << std::endl;
            PrintUsage(argv[0]);
            return 1;
        }

        if (!bOk) {
            std::cerr << "  error: bad value for " << szArg << ": " << argv[i] << std::endl;
            return 1;
        }
    }

    UT::SError sErr;
    BL::SBltConfig sCfg;

    if (!MD::bLoadModelConfig(szModelDir + "/config.json", sCfg.sDecoder, sErr)) {
        std::cerr << "  error: " << sErr.szFormat() << std::endl;
        return 1;
    }

    if (bExplicitBltConfig || std::filesystem::exists(szBltConfig)) {
        if (!BL::bLoadBltConfig(szBltConfig, sCfg, sErr)) {
            std::cerr << "  error: " << sErr.szFormat() << std::endl;
            return 1;
        }
    } else {
        std::cout << "  warning: no blt_config.json, using defaults" << std::endl;
    }

    // flags win over the file
    if (bStrict)
        sCfg.bStrictLoad = true;
    if (bExcludeSet)
        sCfg.vszExcludeParams = vszExclude;

    std::cout << std::endl;
    MD::PrintModelConfig(sCfg.sDecoder);
    BL::PrintBltConfig(sCfg);
    std::cout << std::endl;

    BL::CByteLatentModel sModel;
    if (!sModel.bBuild(sCfg, (uint32_t)iInitSeed, sErr)) {
        std::cerr << "  error: " << sErr.szFormat() << std::endl;
        return 1;
    }
    std::cout << "  built: " << sModel.sRegistry().lNumel(MD::EOrigin::Inherited) << " inherited + "
              << sModel.sRegistry().lNumel(MD::EOrigin::New) << " new params, "
              << sModel.viAdapterLayers().size() << " adapted layers" << std::endl;

    if (!bRandom) {
        MD::SCheckpointSpec sSpec;
        sSpec.szDir = szModelDir;
        sSpec.vszFiles = sCfg.vszCheckpointFiles;
        sSpec.bStrict = sCfg.bStrictLoad;
        sSpec.vszExclude = sCfg.vszExcludeParams;

        MD::SLoadReport sReport;
        if (!sModel.bLoadCheckpoint(sSpec, sReport, sErr)) {
            std::cerr << "  error: " << sErr.szFormat() << std::endl;
            MD::PrintLoadReport(sReport);
            return 1;
        }
        MD::PrintLoadReport(sReport);
    }

    if (!szAdapterIn.empty()) {
        MD::SCheckpointSpec sSpec;
        sSpec.vszFiles = {szAdapterIn};
        sSpec.vszExclude.clear();

        MD::SLoadReport sReport;
        if (!sModel.bLoadCheckpoint(sSpec, sReport, sErr)) {
            std::cerr << "  error: " << sErr.szFormat() << std::endl;
            return 1;
        }
        std::cout << "  adapter: " << sReport.vszLoaded.size() << " tensors restored" << std::endl;
    }

    if (!szAdapterOut.empty()) {
        if (!sModel.bSaveNewParams(szAdapterOut, sErr)) {
            std::cerr << "  error: " << sErr.szFormat() << std::endl;
            return 1;
        }
        std::cout << "  saved new weights to " << szAdapterOut << std::endl;
    }
    std::cout << std::endl;

    TK::CByteTokenizer tok(sCfg.iMaxSeqLen, TK::EOverflow::Error);

    std::cout << "  config: temp=" << sGen.fTemperature << " top_k=" << sGen.iTopK << " max=" << sGen.iMaxNewBytes
              << " kv_cache=" << (sGen.bKvCache ? "on" : "off") << " utf8=" << (sGen.bUtf8Constrain ? "on" : "off")
              << std::endl;
    std::cout << std::endl;

    if (bOneShot) {
        std::cout << szPrompt << std::flush;
        GN::SGenResult sResult;
        if (!bGenerateStreaming(sModel, tok, szPrompt, sGen, sResult, sErr)) {
            std::cerr << "  error: " << sErr.szFormat() << std::endl;
            return 1;
        }
        PrintGenStats(sResult);
        return 0;
    }

    std::cout << "  type a prompt and press enter. /quit to exit, /help for commands." << std::endl;
    std::cout << std::endl;

    while (true) {
        std::cout << "> " << std::flush;

        std::string szInput;
        if (!std::getline(std::cin, szInput))
            break;

        size_t iStart = szInput.find_first_not_of(" \t\n\r");
        if (iStart == std::string::npos)
            continue;
        size_t iEnd = szInput.find_last_not_of(" \t\n\r");
        szInput = szInput.substr(iStart, iEnd - iStart + 1);

        if (szInput == "/quit" || szInput == "/exit" || szInput == "/q")
            break;

        if (szInput == "/clear" || szInput == "/reset") {
            sModel.ResetKvCache();
            std::cout << "  cache cleared." << std::endl;
            std::cout << std::endl;
            continue;
        }

        if (szInput == "/help") {
            std::cout << "  commands:" << std::endl;
            std::cout << "    /quit    exit" << std::endl;
            std::cout << "    /clear   drop the kv cache" << std::endl;
            std::cout << "    /help    show this" << std::endl;
            std::cout << std::endl;
            continue;
        }

        std::cout << std::endl;
        sErr.Clear();
        GN::SGenResult sResult;
        if (!bGenerateStreaming(sModel, tok, szInput, sGen, sResult, sErr))
            std::cerr << "  error: " << sErr.szFormat() << std::endl;

        std::cout << std::endl;
        PrintGenStats(sResult);
        std::cout << std::endl;
    }

    std::cout << std::endl;
    std::cout << "  bye bye!" << std::endl;
    return 0;
}
// >>>s_end(main)
