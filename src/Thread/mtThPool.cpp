// Created by Unium on 22.02.26

#include "mtThPool.hpp"

#include <algorithm>

namespace MT {
namespace TH {

// set on pool workers, nested ParallelFor calls run inline
static thread_local bool s_bInWorker = false;

// below this many iterations the split costs more than it saves
constexpr int64_t kMinParallel = 64;

auto iGetNumCores() -> int {
    int iCores = (int)std::thread::hardware_concurrency();
    return (iCores > 0) ? iCores : 4;
}

auto CThreadPool::iNumThreads() const -> int { return m_iNumThreads; }

CThreadPool::CThreadPool(int iNumThreads) {
    if (iNumThreads <= 0)
        iNumThreads = iGetNumCores();
    m_iNumThreads = iNumThreads;
    m_vThreads.reserve(iNumThreads);

    for (int i = 0; i < iNumThreads; i++) {
        m_vThreads.emplace_back(&CThreadPool::WorkerLoop, this);
    }
}

CThreadPool::~CThreadPool() {
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        m_bStop = true;
    }
    m_cvWork.notify_all();
    for (auto &t : m_vThreads) {
        if (t.joinable())
            t.join();
    }
}

auto CThreadPool::bRunOneChunk() -> bool {
    int64_t lStart = 0;
    int64_t lEnd = 0;
    const TaskFn *pfnTask = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (m_pfnTask == nullptr || m_iNextChunk >= m_iChunks)
            return false;
        int iChunk = m_iNextChunk++;
        lStart = iChunk * m_lChunk;
        lEnd = std::min(lStart + m_lChunk, m_lTotal);
        pfnTask = m_pfnTask;
    }

    if (lStart < lEnd)
        (*pfnTask)(lStart, lEnd);

    {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (--m_iPending == 0)
            m_cvDone.notify_all();
    }
    return true;
}

void CThreadPool::ParallelFor(int64_t lTotal, const TaskFn &lfnTask) {
    if (lTotal <= 0)
        return;

    if (lTotal < kMinParallel || m_iNumThreads <= 1 || s_bInWorker) {
        lfnTask(0, lTotal);
        return;
    }

    std::lock_guard<std::mutex> submit(m_mtxSubmit);

    int iChunks = (int)std::min<int64_t>((int64_t)m_iNumThreads, lTotal);
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        m_pfnTask = &lfnTask;
        m_lTotal = lTotal;
        m_lChunk = (lTotal + iChunks - 1) / iChunks;
        m_iChunks = iChunks;
        m_iNextChunk = 0;
        m_iPending = iChunks;
        m_lGeneration++;
    }
    m_cvWork.notify_all();

    // the caller helps instead of idling, its chunks count as worker code
    s_bInWorker = true;
    while (bRunOneChunk()) {
    }
    s_bInWorker = false;

    std::unique_lock<std::mutex> lock(m_mtx);
    m_cvDone.wait(lock, [&]() { return m_iPending == 0; });
    m_pfnTask = nullptr;
}

void CThreadPool::WorkerLoop() {
    s_bInWorker = true;
    uint64_t lSeen = 0;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_mtx);
            m_cvWork.wait(lock, [&]() { return m_bStop || m_lGeneration != lSeen; });
            if (m_bStop)
                return;
            lSeen = m_lGeneration;
        }

        while (bRunOneChunk()) {
        }
    }
}

auto GetGlobalPool() -> CThreadPool & {
    static CThreadPool s_pool(0);
    return s_pool;
}

void ParFor(int64_t lTotal, const CThreadPool::TaskFn &lfnTask) { GetGlobalPool().ParallelFor(lTotal, lfnTask); }
} // namespace TH
} // namespace MT
