// Created by Unium on 14.03.26

#include "tsTsTstf.hpp"

#include <cstring>
#include <iostream>

using namespace MT;

// one translation unit, the module tag applies to every TEST below it
// clang-format off
TEST_MODULE("tensor")
#include "tsTnTnsr.hpp"
TEST_MODULE("ops")
#include "tsTnOps_.hpp"
TEST_MODULE("thread")
#include "tsThThrd.hpp"
TEST_MODULE("tokenizer")
#include "tsTkByte.hpp"
TEST_MODULE("block")
#include "tsMdBlck.hpp"
TEST_MODULE("load")
#include "tsMdLoad.hpp"
TEST_MODULE("config")
#include "tsLtConf.hpp"
TEST_MODULE("patcher")
#include "tsLtPtch.hpp"
TEST_MODULE("pool")
#include "tsLtPool.hpp"
TEST_MODULE("local")
#include "tsLtLenc.hpp"
TEST_MODULE("xattn")
#include "tsLtXatn.hpp"
TEST_MODULE("model")
#include "tsLtModl.hpp"
TEST_MODULE("generate")
#include "tsGnLoop.hpp"
// clang-format on

/*---------------------------------------------------------
 * FN: main
 * DESC: runs every registered test, or one module with
 *       --tests <module>
 * PARMS: argc, argv
 * AUTH: unium (14.03.26)
 *-------------------------------------------------------*/
int main(int argc, char *argv[]) {
    const char *szFilter = nullptr;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--tests") == 0 && i + 1 < argc) {
            szFilter = argv[++i];
        } else {
            std::cerr << "usage: " << argv[0] << " [--tests <module>]" << std::endl;
            return 2;
        }
    }

    RunTests(szFilter);

    std::cout << "ran " << s_iTestsRun << ", passed " << s_iTestsPassed << ", failed " << s_iTestsFailed
              << std::endl;
    if (s_iTestsRun == 0)
        std::cout << "no tests matched '" << (szFilter ? szFilter : "") << "'" << std::endl;
    return s_iTestsFailed > 0 ? 1 : 0;
}
