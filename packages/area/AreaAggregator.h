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

#ifndef __area_aggregator__
#define __area_aggregator__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "GdalRaster.h"
#include "ClassLookup.h"
#include "AreaMatrix.h"
#include "RegionLayer.h"

#include <string>
#include <vector>

/******************************************************************************
 * AREA AGGREGATOR CLASS
 *
 *  Walks the features of a boundary layer and accumulates the classified
 *  area of the source raster inside each region. The feature list may be
 *  split across worker threads; each worker opens its own raster handle and
 *  fills a private matrix that is merged once all workers are joined.
 ******************************************************************************/

class AreaAggregator
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const uint32_t MIN_FEATURES_PER_THREAD = 1;
        static const int      MAX_THREADS = 64;

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef struct {
            uint32_t start;
            uint32_t end;
        } range_t;

        typedef struct {
            long processed;     // features scanned
            long skipped;       // features with an empty clip
            long unresolved;    // features without a region name
        } stats_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        virtual             ~AreaAggregator     (void) = default;

        void                aggregate           (const RegionLayer& regions, AreaMatrix& matrix);
        const stats_t&      getStats            (void) const { return stats; }
        int                 getNumThreads       (void) const { return numThreads; }

        static void         getThreadsRanges    (std::vector<range_t>& ranges, uint32_t num,
                                                 uint32_t minPerThread, uint32_t maxNumThreads);

    protected:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                            AreaAggregator      (const std::string& _rasterFile, const ClassLookup* _lookup, int _numThreads);

        /* returns false when the feature had nothing to scan */
        virtual bool        processFeature      (GdalRaster& raster, const RegionLayer& regions,
                                                 const RegionFeature& feature, AreaMatrix& matrix) = 0;

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        std::string         rasterFile;
        const ClassLookup*  lookup;

    private:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef struct Worker {
            AreaAggregator*     aggregator;
            const RegionLayer*  regions;
            range_t             range;
            AreaMatrix*         matrix;
            RunTimeException*   error;

            Worker (AreaAggregator* _aggregator, const RegionLayer* _regions, const range_t& _range, const std::vector<class_key_t>& columns):
                aggregator(_aggregator), regions(_regions), range(_range), matrix(new AreaMatrix(columns)), error(NULL) {}
            ~Worker (void) { delete matrix; delete error; }
        } worker_t;

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        int                 numThreads;
        stats_t             stats;
        Mutex               statsMut;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static void*        workerThread        (void* parm);
        void                processRange        (const RegionLayer& regions, const range_t& range, AreaMatrix& matrix);
};

#endif  /* __area_aggregator__ */
