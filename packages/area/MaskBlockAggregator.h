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

#ifndef __mask_block_aggregator__
#define __mask_block_aggregator__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "AreaAggregator.h"

/******************************************************************************
 * MASK BLOCK AGGREGATOR CLASS
 *
 *  Scans the source raster tile by tile against a precomputed per-region
 *  mask raster on the same grid. Tiles that the mask stores as sparse holes
 *  are never read.
 ******************************************************************************/

class MaskBlockAggregator: public AreaAggregator
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const int32_t MASKED = -1;      // pixel outside of the region
        static const char*   MASK_SUFFIX;
        static const double  GRID_TOLERANCE;   // fraction of a pixel

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                    MaskBlockAggregator     (const std::string& _rasterFile, const ClassLookup* _lookup,
                                             const std::string& _maskDir, bool _skipSparse=true, int _numThreads=1);
                    ~MaskBlockAggregator    (void) override = default;

        std::string getMaskFile             (const RegionFeature& feature) const;
        long        getBlocksRead           (void) const { return blocksRead; }
        long        getBlocksSkipped        (void) const { return blocksSkipped; }

        static int  blklim                  (int coord, int blksiz, int totsiz);

    protected:

        bool        processFeature          (GdalRaster& raster, const RegionLayer& regions,
                                             const RegionFeature& feature, AreaMatrix& matrix) override;

    private:

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        std::string maskDir;
        bool        skipSparse;
        Mutex       blockMut;
        long        blocksRead;
        long        blocksSkipped;
};

#endif  /* __mask_block_aggregator__ */
