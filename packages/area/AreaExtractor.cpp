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

#include "AreaExtractor.h"
#include "AreaWriter.h"
#include "ClassLookup.h"
#include "GdalRaster.h"
#include "MaskBlockAggregator.h"
#include "ScratchDir.h"
#include "VectorClipAggregator.h"
#include "EventLib.h"
#include "StringLib.h"

#include <cpl_conv.h>
#include <cpl_vsi.h>

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
AreaExtractor::AreaExtractor(const AreaParms& _parms):
    parms(_parms),
    scratch("regionarea"),
    regions(NULL)
{
    const std::string cachemax = StringLib::strfmt("%d", parms.gdal_cachemax);
    CPLSetConfigOption("GDAL_CACHEMAX", cachemax.c_str());
    mlog(DEBUG, "GDAL block cache set to %s MB", cachemax.c_str());
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
AreaExtractor::~AreaExtractor(void)
{
    delete regions;
}

/*----------------------------------------------------------------------------
 * run
 *
 *  Processes every dataset configured for the flag; returns the number of
 *  datasets that failed. A raster, boundary file or mask that cannot be
 *  opened is rethrown and no further dataset is attempted.
 *----------------------------------------------------------------------------*/
int AreaExtractor::run(const char* flag)
{
    int errors = 0;

    const AreaParms::dataset_list_t& list = parms.getDatasets(flag);
    if(list.empty())
    {
        mlog(WARNING, "No datasets configured for --%s", flag);
        return 0;
    }

    for(const AreaParms::dataset_t& dataset: list)
    {
        if(dataset.optional && !GdalRaster::exists(dataset.raster))
        {
            print2term("Skipping missing %s\n", dataset.raster.c_str());
            continue;
        }

        try
        {
            runDataset(dataset);
        }
        catch(const RunTimeException& e)
        {
            mlog(e.level(), "Failed to process %s: %s", dataset.raster.c_str(), e.what());
            if(e.code() == RTE_RESOURCE_DOES_NOT_EXIST) throw;
            errors++;
        }
    }

    return errors;
}

/*----------------------------------------------------------------------------
 * runDataset
 *----------------------------------------------------------------------------*/
void AreaExtractor::runDataset(const AreaParms::dataset_t& dataset)
{
    print2term("%s\n", dataset.raster.c_str());

    AreaMatrix* matrix = NULL;
    extract(dataset, matrix);

    try
    {
        makeResultsDir();
        const std::string fileName = parms.results + PATH_DELIMETER_STR + dataset.output;
        AreaWriter::write(fileName, *matrix, parms.format);
    }
    catch(const RunTimeException&)
    {
        delete matrix;
        throw;
    }

    delete matrix;
    print2term("\n");
}

/*----------------------------------------------------------------------------
 * extract
 *
 *  Aggregates one dataset into a newly allocated matrix owned by the caller
 *----------------------------------------------------------------------------*/
void AreaExtractor::extract(const AreaParms::dataset_t& dataset, AreaMatrix*& matrix)
{
    const RegionLayer& layer = getRegions();

    /* Source is only opened here to build the lookup; aggregators open their own */
    ClassLookup* lookup = NULL;
    {
        GdalRaster source(dataset.raster);
        source.open();
        lookup = ClassLookup::create(dataset.lookup.c_str(), &source);
    }

    AreaAggregator* aggregator = NULL;
    matrix = new AreaMatrix(lookup->columns());

    try
    {
        if(dataset.method == AreaParms::VECTOR_CLIP)
        {
            aggregator = new VectorClipAggregator(dataset.raster, lookup, scratch, parms.threads);
        }
        else
        {
            aggregator = new MaskBlockAggregator(dataset.raster, lookup, parms.masks, parms.skip_sparse, parms.threads);
        }

        aggregator->aggregate(layer, *matrix);
    }
    catch(const RunTimeException&)
    {
        delete aggregator;
        delete lookup;
        delete matrix;
        matrix = NULL;
        throw;
    }

    delete aggregator;
    delete lookup;
}

/*----------------------------------------------------------------------------
 * getRegions
 *
 *  Boundary layer is loaded on first use and shared by every dataset
 *----------------------------------------------------------------------------*/
const RegionLayer& AreaExtractor::getRegions(void)
{
    if(regions == NULL)
    {
        RegionLayer* layer = new RegionLayer(parms.names);
        try
        {
            layer->load(parms.boundaries);
        }
        catch(const RunTimeException&)
        {
            delete layer;
            throw;
        }
        regions = layer;
    }

    return *regions;
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * makeResultsDir
 *----------------------------------------------------------------------------*/
void AreaExtractor::makeResultsDir(void) const
{
    VSIStatBufL sbuf;
    if(VSIStatL(parms.results.c_str(), &sbuf) == 0)
    {
        if(!VSI_ISDIR(sbuf.st_mode))
            throw RunTimeException(CRITICAL, RTE_ERROR, "Results path is not a directory: %s", parms.results.c_str());
        return;
    }

    if(VSIMkdir(parms.results.c_str(), 0755) != 0)
        throw RunTimeException(CRITICAL, RTE_ERROR, "Failed to create results directory: %s", parms.results.c_str());
}
