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

#include "VectorClipAggregator.h"
#include "GeoLib.h"
#include "EventLib.h"
#include "StringLib.h"

#include <map>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* VectorClipAggregator::FEATURE_MASK_SUFFIX = "_feature_mask.shp";
const char* VectorClipAggregator::FEATURE_CLIP_SUFFIX = "_feature.tif";

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
VectorClipAggregator::VectorClipAggregator(const std::string& _rasterFile, const ClassLookup* _lookup,
                                           const ScratchDir& _scratch, int _numThreads):
    AreaAggregator(_rasterFile, _lookup, _numThreads),
    scratch(_scratch)
{
}

/*----------------------------------------------------------------------------
 * scanClip
 *
 *  Every pixel in a row covers the same area, so a row reduces to a count
 *  per distinct value
 *----------------------------------------------------------------------------*/
void VectorClipAggregator::scanClip(const std::string& clipFile, const std::string& region, AreaMatrix& matrix) const
{
    GdalRaster clip(clipFile);
    clip.open();

    const GeoLib::PixelArea area(clip.getGeoTransform());
    const int cols = clip.getCols();
    const int rows = clip.getRows();

    std::vector<int32_t> data(cols);
    std::map<int32_t, long> counts;
    class_key_t key;

    for(int row = 0; row < rows; row++)
    {
        clip.readRows(row, 1, &data[0]);

        counts.clear();
        for(int col = 0; col < cols; col++)
        {
            counts[data[col]]++;
        }

        const double km2 = area.rowKm2(row);
        for(const auto& count: counts)
        {
            if(lookup->classify(count.first, key))
            {
                matrix.add(region, key, count.second * km2);
            }
        }
    }
}

/******************************************************************************
 * PROTECTED METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * processFeature
 *----------------------------------------------------------------------------*/
bool VectorClipAggregator::processFeature(GdalRaster& raster, const RegionLayer& regions,
                                          const RegionFeature& feature, AreaMatrix& matrix)
{
    const std::string prefix = StringLib::strfmt("%s_%d", feature.a3.c_str(), feature.index);

    /* Region lies entirely off the raster */
    if(!GeoLib::cutlineOverlaps(raster.getDataset(), feature.geometry, regions.getSpatialRef()))
    {
        print2term("Skipping empty %-41s #%s\n", feature.region.c_str(), prefix.c_str());
        return false;
    }

    /* Removed on every exit path, in reverse order of creation */
    const ScratchFile maskFile(scratch.file(prefix + FEATURE_MASK_SUFFIX), GeoLib::SHAPEFILE_DRIVER);
    const ScratchFile clipFile(scratch.file(prefix + FEATURE_CLIP_SUFFIX), GeoLib::GEOTIFF_DRIVER);

    /* Polygon of this one feature is the cutline */
    GeoLib::writeFeatureLayer(maskFile.getName(), feature.geometry, regions.getSpatialRef());

    if(!GeoLib::warpToCutline(raster.getDataset(), clipFile.getName(), maskFile.getName(), lookup->allTouched()))
    {
        print2term("Skipping empty %-41s #%s\n", feature.region.c_str(), prefix.c_str());
        return false;
    }

    print2term("Processing %-41s #%s\n", feature.region.c_str(), prefix.c_str());
    scanClip(clipFile.getName(), feature.region, matrix);
    return true;
}
