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

#include "MaskBlockAggregator.h"
#include "GeoLib.h"
#include "EventLib.h"
#include "StringLib.h"

#include <map>
#include <math.h>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* MaskBlockAggregator::MASK_SUFFIX = "_1km_mask.tif";
const double MaskBlockAggregator::GRID_TOLERANCE = 1e-6;

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
MaskBlockAggregator::MaskBlockAggregator(const std::string& _rasterFile, const ClassLookup* _lookup,
                                         const std::string& _maskDir, bool _skipSparse, int _numThreads):
    AreaAggregator(_rasterFile, _lookup, _numThreads),
    maskDir(_maskDir),
    skipSparse(_skipSparse),
    blocksRead(0),
    blocksSkipped(0)
{
}

/*----------------------------------------------------------------------------
 * getMaskFile
 *----------------------------------------------------------------------------*/
std::string MaskBlockAggregator::getMaskFile(const RegionFeature& feature) const
{
    return maskDir + PATH_DELIMETER_STR + StringLib::strfmt("%s_%d%s", feature.a3.c_str(), feature.index, MASK_SUFFIX);
}

/*----------------------------------------------------------------------------
 * blklim
 *
 *  Size of the block starting at coord, clipped to the edge of the raster
 *----------------------------------------------------------------------------*/
int MaskBlockAggregator::blklim(int coord, int blksiz, int totsiz)
{
    if((coord + blksiz) < totsiz) return blksiz;
    return totsiz - coord;
}

/******************************************************************************
 * PROTECTED METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * processFeature
 *----------------------------------------------------------------------------*/
bool MaskBlockAggregator::processFeature(GdalRaster& raster, const RegionLayer& regions,
                                         const RegionFeature& feature, AreaMatrix& matrix)
{
    (void)regions;

    const std::string maskFile = getMaskFile(feature);
    if(!GdalRaster::exists(maskFile))
    {
        throw RunTimeException(CRITICAL, RTE_RESOURCE_DOES_NOT_EXIST, "Missing mask for %s: %s", feature.region.c_str(), maskFile.c_str());
    }

    print2term("Processing %-41s #%s_%d\n", feature.region.c_str(), feature.a3.c_str(), feature.index);

    GdalRaster mask(maskFile);
    mask.open();

    const int xsize = raster.getCols();
    const int ysize = raster.getRows();
    if(mask.getCols() != xsize || mask.getRows() != ysize)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "Mask %s is %d x %d, source is %d x %d",
                               maskFile.c_str(), mask.getCols(), mask.getRows(), xsize, ysize);
    }

    /* Same size is not enough, the mask must sit on the source grid */
    const double* srcGt = raster.getGeoTransform();
    const double* maskGt = mask.getGeoTransform();
    const double tolerance = GRID_TOLERANCE * fabs(srcGt[1]);
    for(int i = 0; i < 6; i++)
    {
        if(fabs(maskGt[i] - srcGt[i]) > tolerance)
        {
            throw RunTimeException(CRITICAL, RTE_ERROR, "Mask %s is not on the source grid, geotransform[%d] is %.9lf, source is %.9lf",
                                   maskFile.c_str(), i, maskGt[i], srcGt[i]);
        }
    }

    const GeoLib::PixelArea area(srcGt);
    const int xblksiz = raster.getBlockXSize();
    const int yblksiz = raster.getBlockYSize();

    std::vector<int32_t> block;
    std::vector<int32_t> maskBlock;
    std::vector<double> km2;
    std::map<int32_t, double> sums;
    class_key_t key;
    long numRead = 0;
    long numSkipped = 0;

    for(int y = 0; y < ysize; y += yblksiz)
    {
        const int nrows = blklim(y, yblksiz, ysize);
        for(int x = 0; x < xsize; x += xblksiz)
        {
            const int ncols = blklim(x, xblksiz, xsize);

            /* Sparse hole in the mask, nothing of this region here */
            if(skipSparse && mask.isSparse(x, y, ncols, nrows))
            {
                numSkipped++;
                continue;
            }

            const size_t npixels = static_cast<size_t>(ncols) * nrows;
            block.resize(npixels);
            maskBlock.resize(npixels);
            raster.readBlock(x, y, ncols, nrows, &block[0]);
            mask.readBlock(x, y, ncols, nrows, &maskBlock[0]);
            area.blockKm2(y, nrows, ncols, km2);
            numRead++;

            /* Sum area per distinct value of the masked block */
            sums.clear();
            for(size_t k = 0; k < npixels; k++)
            {
                const int32_t value = (maskBlock[k] == 0) ? MASKED : block[k];
                sums[value] += km2[k];
            }

            for(const auto& sum: sums)
            {
                if(sum.first == MASKED) continue;
                if(lookup->classify(sum.first, key))
                {
                    matrix.add(feature.region, key, sum.second);
                }
            }
        }
    }

    blockMut.lock();
    {
        blocksRead += numRead;
        blocksSkipped += numSkipped;
    }
    blockMut.unlock();

    mlog(DEBUG, "Mask %s: %ld blocks read, %ld sparse blocks skipped", maskFile.c_str(), numRead, numSkipped);
    return true;
}
