// Created by Unium on 22.02.26

#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace MT {
namespace TH {
/*---------------------------------------------------------
 * FN: iGetNumCores
 * DESC: returns the number of hardware threads available
 * PARMS: none
 * AUTH: unium (22.02.26)
 *-------------------------------------------------------*/
auto iGetNumCores() -> int;

/*---------------------------------------------------------
 * FN: CThreadPool
 * DESC: fixed set of workers that split [0, n) ranges.
 *       one ParallelFor runs at a time, a ParallelFor issued
 *       from inside a worker runs inline on that worker
 * AUTH: unium (22.02.26 R: 04.03.26)
 *-------------------------------------------------------*/
class CThreadPool {
public:
    using TaskFn = std::function<void(int64_t, int64_t)>;

    /*---------------------------------------------------------
     * FN: CThreadPool
     * DESC: constructs a thread pool with iNumThreads workers
     * PARMS: iNumThreads (0 = autodetect)
     * AUTH: unium (22.02.26)
     *-------------------------------------------------------*/
    explicit CThreadPool(int iNumThreads = 0);

    /*---------------------------------------------------------
     * FN: ~CThreadPool
     * DESC: wakes all workers with the stop flag and joins them
     * PARMS: none
     * AUTH: unium (22.02.26)
     *-------------------------------------------------------*/
    ~CThreadPool();

    // <<<ignore
    CThreadPool(const CThreadPool &) = delete;
    CThreadPool &operator=(const CThreadPool &) = delete;
    // >>>ignore

    /*---------------------------------------------------------
     * FN: ParallelFor
     * DESC: splits range [0, lTotal) across threads
     *       each thread calls lfnTask(lStart, lEnd)
     *       with its assigned bits and blocks until all done
     * PARMS: lTotal (total iterations), lfnTask (work fn)
     * AUTH: unium (22.02.26 R: 04.03.26)
     *-------------------------------------------------------*/
    void ParallelFor(int64_t lTotal, const TaskFn &lfnTask);

    auto iNumThreads() const -> int;

private:
    std::vector<std::thread> m_vThreads;
    int m_iNumThreads = 0;

    // <<<v_start(job)
    // guarded by m_mtx
    const TaskFn *m_pfnTask = nullptr;
    int64_t m_lTotal = 0;
    int64_t m_lChunk = 0;
    int m_iChunks = 0;
    int m_iNextChunk = 0;
    int m_iPending = 0;
    uint64_t m_lGeneration = 0;
    bool m_bStop = false;
    // >>>end(job)

    std::mutex m_mtxSubmit;
    std::mutex m_mtx;
    std::condition_variable m_cvWork;
    std::condition_variable m_cvDone;

    /*---------------------------------------------------------
     * FN: WorkerLoop
     * DESC: main loop for each worker thread, claims chunks of
     *       the current job until none are left
     * PARMS: none
     * AUTH: unium (22.02.26 R: 04.03.26)
     *-------------------------------------------------------*/
    void WorkerLoop();

    /*---------------------------------------------------------
     * FN: bRunOneChunk
     * DESC: claims and runs one chunk of the current job,
     *       false once the job has no chunks left
     * PARMS: none
     * AUTH: unium (04.03.26)
     *-------------------------------------------------------*/
    auto bRunOneChunk() -> bool;
};

/*---------------------------------------------------------
 * FN: GetGlobalPool
 * DESC: returns a reference to global pool
 * PARMS: none
 * AUTH: unium (22.02.26)
 *-------------------------------------------------------*/
auto GetGlobalPool() -> CThreadPool &;

/*---------------------------------------------------------
 * FN: ParFor
 * DESC: wrapper around gp PF
 * PARMS: lTotal (total), lfnTask (work fn)
 * AUTH: unium (22.02.26)
 *-------------------------------------------------------*/
void ParFor(int64_t lTotal, const CThreadPool::TaskFn &lfnTask);
} // namespace TH
} // namespace MT
