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

#include "RegionLayer.h"
#include "GdalRaster.h"
#include "EventLib.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* RegionLayer::ADMIN_FIELD = "ADMIN";
const char* RegionLayer::SOV_A3_FIELD = "SOV_A3";

/******************************************************************************
 * REGION FEATURE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
RegionFeature::RegionFeature(int _index, const char* _admin, const char* _a3, const OGRGeometry* geom):
    index(_index),
    admin(_admin ? _admin : ""),
    a3(_a3 ? _a3 : ""),
    resolved(false),
    geometry(geom ? geom->clone() : NULL)
{
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
RegionFeature::~RegionFeature(void)
{
    delete geometry;
}

/******************************************************************************
 * REGION LAYER METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
RegionLayer::RegionLayer(const RegionNames& _names):
    names(_names),
    srs(NULL)
{
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
RegionLayer::~RegionLayer(void)
{
    clear();
}

/*----------------------------------------------------------------------------
 * load
 *
 *  Clones every feature of the single layer in the boundary file
 *----------------------------------------------------------------------------*/
void RegionLayer::load(const std::string& fileName)
{
    clear();

    GDALDataset* dset = static_cast<GDALDataset*>(GDALOpenEx(fileName.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, NULL, NULL, NULL));
    if(dset == NULL)
        throw RunTimeException(CRITICAL, RTE_RESOURCE_DOES_NOT_EXIST, "Failed to open boundary file: %s", fileName.c_str());

    try
    {
        if(dset->GetLayerCount() != 1)
            throw RunTimeException(CRITICAL, RTE_ERROR, "Boundary file must have exactly one layer, found %d: %s", dset->GetLayerCount(), fileName.c_str());

        OGRLayer* layer = dset->GetLayer(0);
        CHECKPTR(layer);

        setSpatialRef(layer->GetSpatialRef());

        layer->ResetReading();
        while(OGRFeature* feature = layer->GetNextFeature())
        {
            const int adminField = feature->GetFieldIndex(ADMIN_FIELD);
            const int a3Field = feature->GetFieldIndex(SOV_A3_FIELD);
            const char* admin = (adminField >= 0 && feature->IsFieldSetAndNotNull(adminField)) ? feature->GetFieldAsString(adminField) : NULL;
            const char* a3 = (a3Field >= 0 && feature->IsFieldSetAndNotNull(a3Field)) ? feature->GetFieldAsString(a3Field) : NULL;

            add(admin, a3, feature->GetGeometryRef());
            OGRFeature::DestroyFeature(feature);
        }
    }
    catch(const RunTimeException&)
    {
        GDALClose((GDALDatasetH)dset);
        clear();
        throw;
    }

    GDALClose((GDALDatasetH)dset);
    mlog(INFO, "Loaded %d boundary features (%d resolved) from %s", length(), numResolved(), fileName.c_str());
}

/*----------------------------------------------------------------------------
 * add
 *----------------------------------------------------------------------------*/
void RegionLayer::add(const char* admin, const char* a3, const OGRGeometry* geom)
{
    RegionFeature* feature = new RegionFeature(length(), admin, a3, geom);
    feature->resolved = names.lookup(admin, feature->region);
    if(feature->resolved && feature->geometry == NULL)
    {
        mlog(WARNING, "Boundary feature %d (%s) has no geometry", feature->index, feature->admin.c_str());
        feature->resolved = false;
    }
    features.push_back(feature);
}

/*----------------------------------------------------------------------------
 * setSpatialRef
 *----------------------------------------------------------------------------*/
void RegionLayer::setSpatialRef(const OGRSpatialReference* _srs)
{
    if(srs) srs->Release();
    srs = _srs ? _srs->Clone() : NULL;
}

/*----------------------------------------------------------------------------
 * numResolved
 *----------------------------------------------------------------------------*/
int RegionLayer::numResolved(void) const
{
    int count = 0;
    for(const RegionFeature* feature: features)
    {
        if(feature->resolved) count++;
    }
    return count;
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * clear
 *----------------------------------------------------------------------------*/
void RegionLayer::clear(void)
{
    for(RegionFeature* feature: features)
    {
        delete feature;
    }
    features.clear();

    if(srs)
    {
        srs->Release();
        srs = NULL;
    }
}
