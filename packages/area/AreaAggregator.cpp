/*
 * Copyright (c) 2021, University of Washington
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * 3. Neither the name of the University of Washington nor the names of its
 *    contributors may be used to endorse or promote products derived from this
 *    software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE UNIVERSITY OF WASHINGTON AND CONTRIBUTORS
 * “AS IS” AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE UNIVERSITY OF WASHINGTON OR
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;
 * OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR
 * OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "AreaAggregator.h"
#include "EventLib.h"
#include "core.h"

#include <algorithm>

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * aggregate
 *----------------------------------------------------------------------------*/
void AreaAggregator::aggregate(const RegionLayer& regions, AreaMatrix& matrix)
{
    if(lookup->columns() != matrix.getColumns())
        throw RunTimeException(CRITICAL, RTE_ERROR, "matrix columns do not match the %s lookup", lookup->getName());

    statsMut.lock();
    {
        stats.processed = 0;
        stats.skipped = 0;
        stats.unresolved = 0;
    }
    statsMut.unlock();

    std::vector<range_t> ranges;
    getThreadsRanges(ranges, regions.length(), MIN_FEATURES_PER_THREAD, numThreads);

    for(uint32_t i = 0; i < ranges.size(); i++)
    {
        const range_t& range = ranges[i];
        mlog(DEBUG, "range-%u: %u to %u", i, range.start, range.end);
    }

    const uint32_t threads = ranges.size();
    mlog(INFO, "Aggregating %d features of %s with %u thread(s)", regions.length(), rasterFile.c_str(), threads);

    if(threads <= 1)
    {
        /* Single thread, accumulate directly into the caller's matrix */
        const range_t all = {0, static_cast<uint32_t>(regions.length())};
        processRange(regions, all, matrix);
    }
    else
    {
        std::vector<worker_t*> workers;
        std::vector<Thread*> pids;

        try
        {
            /* Start worker threads */
            for(uint32_t i = 0; i < threads; i++)
            {
                worker_t* worker = new worker_t(this, &regions, ranges[i], matrix.getColumns());
                workers.push_back(worker);
                Thread* pid = new Thread(workerThread, worker);
                pids.push_back(pid);
            }
        }
        catch(const RunTimeException& e)
        {
            mlog(e.level(), "Failed to start aggregation workers: %s", e.what());
            for(Thread* pid : pids) delete pid;
            for(worker_t* worker : workers) delete worker;
            throw;
        }

        /* Wait for all worker threads to finish */
        for(Thread* pid : pids)
        {
            delete pid;
        }

        /* Merge partial results only when every worker succeeded */
        const worker_t* failed = NULL;
        for(const worker_t* worker : workers)
        {
            if(worker->error)
            {
                failed = worker;
                break;
            }
        }

        if(failed)
        {
            const RunTimeException e(*failed->error);
            for(worker_t* worker : workers) delete worker;
            throw e;
        }

        for(worker_t* worker : workers)
        {
            matrix.merge(*worker->matrix);
            delete worker;
        }
    }

    mlog(INFO, "Aggregated %s: %ld processed, %ld empty, %ld unresolved",
         rasterFile.c_str(), stats.processed, stats.skipped, stats.unresolved);
}

/*----------------------------------------------------------------------------
 * getThreadsRanges
 *----------------------------------------------------------------------------*/
void AreaAggregator::getThreadsRanges(std::vector<range_t>& ranges, uint32_t num,
                                      uint32_t minPerThread, uint32_t maxNumThreads)
{
    ranges.clear();

    /* Determine how many threads to use */
    if(num <= minPerThread || maxNumThreads <= 1)
    {
        ranges.emplace_back(range_t{0, num});
        return;
    }

    const uint32_t numThreads = std::min(maxNumThreads, num / minPerThread);

    const uint32_t featuresPerThread = num / numThreads;
    uint32_t remainingFeatures = num % numThreads;

    uint32_t start = 0;
    for(uint32_t i = 0; i < numThreads; i++)
    {
        const uint32_t end = start + featuresPerThread + (remainingFeatures > 0 ? 1 : 0);
        ranges.emplace_back(range_t{start, end});

        start = end;
        if(remainingFeatures > 0)
        {
            remainingFeatures--;
        }
    }
}

/******************************************************************************
 * PROTECTED METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
AreaAggregator::AreaAggregator(const std::string& _rasterFile, const ClassLookup* _lookup, int _numThreads):
    rasterFile(_rasterFile),
    lookup(_lookup),
    numThreads(_numThreads),
    stats{0, 0, 0}
{
    if(lookup == NULL)
        throw RunTimeException(CRITICAL, RTE_ERROR, "aggregator requires a class lookup");

    if(numThreads < 1 || numThreads > MAX_THREADS)
        throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "invalid number of threads: %d", numThreads);
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * workerThread
 *----------------------------------------------------------------------------*/
void* AreaAggregator::workerThread(void* parm)
{
    worker_t* worker = static_cast<worker_t*>(parm);

    try
    {
        worker->aggregator->processRange(*worker->regions, worker->range, *worker->matrix);
    }
    catch(const RunTimeException& e)
    {
        mlog(e.level(), "Aggregation worker %u-%u failed: %s", worker->range.start, worker->range.end, e.what());
        worker->error = new RunTimeException(e);
    }

    /* Exit Thread */
    return NULL;
}

/*----------------------------------------------------------------------------
 * processRange
 *----------------------------------------------------------------------------*/
void AreaAggregator::processRange(const RegionLayer& regions, const range_t& range, AreaMatrix& matrix)
{
    stats_t local = {0, 0, 0};

    /* Each range reads through its own raster handle */
    GdalRaster raster(rasterFile);
    raster.open();

    for(uint32_t i = range.start; i < range.end; i++)
    {
        if(!checkactive())
        {
            throw RunTimeException(CRITICAL, RTE_ERROR, "aggregation of %s interrupted", rasterFile.c_str());
        }

        const RegionFeature& feature = regions.get(i);
        if(!feature.resolved)
        {
            mlog(DEBUG, "Skipping unresolved region <%s> #%s_%d", feature.admin.c_str(), feature.a3.c_str(), feature.index);
            local.unresolved++;
            continue;
        }

        /* Resolved regions always get a row, even if nothing is accumulated */
        matrix.ensureRegion(feature.region);

        if(processFeature(raster, regions, feature, matrix)) local.processed++;
        else                                                  local.skipped++;
    }

    statsMut.lock();
    {
        stats.processed += local.processed;
        stats.skipped += local.skipped;
        stats.unresolved += local.unresolved;
    }
    statsMut.unlock();
}
