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

#include "GdalRaster.h"
#include "EventLib.h"

#include <algorithm>
#include <cpl_vsi.h>

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
GdalRaster::GdalRaster(const std::string& _fileName):
   fileName   (_fileName),
   dset       (NULL),
   band       (NULL),
   xsize      (0),
   ysize      (0),
   xblocksize (0),
   yblocksize (0),
   bbox       (),
   geoTransform()
{
}

/*----------------------------------------------------------------------------
 * Destructor
 *----------------------------------------------------------------------------*/
GdalRaster::~GdalRaster(void)
{
    close();
}

/*----------------------------------------------------------------------------
 * open
 *----------------------------------------------------------------------------*/
void GdalRaster::open(void)
{
    if(dset)
    {
        mlog(DEBUG, "Raster already opened: %s", fileName.c_str());
        return;
    }

    dset = static_cast<GDALDataset*>(GDALOpenEx(fileName.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, NULL, NULL, NULL));
    if(dset == NULL)
        throw RunTimeException(CRITICAL, RTE_RESOURCE_DOES_NOT_EXIST, "Failed to open raster: %s", fileName.c_str());

    mlog(DEBUG, "Opened %s", fileName.c_str());

    try
    {
        if(dset->GetRasterCount() < 1)
            throw RunTimeException(CRITICAL, RTE_ERROR, "Raster has no bands: %s", fileName.c_str());

        /* Store information about raster */
        xsize = dset->GetRasterXSize();
        ysize = dset->GetRasterYSize();

        const CPLErr err = dset->GetGeoTransform(geoTransform);
        CHECK_GDALERR(err);

        /* Only north-up rasters without rotation are supported */
        if(geoTransform[2] != 0.0 || geoTransform[4] != 0.0)
            throw RunTimeException(CRITICAL, RTE_ERROR, "Rotated geotransform not supported: %s", fileName.c_str());

        /* Get raster boundry box */
        bbox.lon_min = geoTransform[0];
        bbox.lon_max = geoTransform[0] + xsize * geoTransform[1];
        bbox.lat_max = geoTransform[3];
        bbox.lat_min = geoTransform[3] + ysize * geoTransform[5];

        band = dset->GetRasterBand(1);
        CHECKPTR(band);

        /* Native tiling */
        band->GetBlockSize(&xblocksize, &yblocksize);
        if(xblocksize <= 0) xblocksize = xsize;
        if(yblocksize <= 0) yblocksize = 1;

        mlog(DEBUG, "Raster %s: %d x %d, block %d x %d, extent (%.4lf, %.4lf) (%.4lf, %.4lf)",
             fileName.c_str(), xsize, ysize, xblocksize, yblocksize,
             bbox.lon_min, bbox.lat_min, bbox.lon_max, bbox.lat_max);
    }
    catch(const RunTimeException&)
    {
        close();
        throw;
    }
}

/*----------------------------------------------------------------------------
 * close
 *----------------------------------------------------------------------------*/
void GdalRaster::close(void)
{
    if(dset)
    {
        GDALClose((GDALDatasetH)dset);
        dset = NULL;
        band = NULL;
    }
}

/*----------------------------------------------------------------------------
 * readRows
 *
 *  Reads nrows full width rows starting at yoff into data (nrows x cols)
 *----------------------------------------------------------------------------*/
void GdalRaster::readRows(int yoff, int nrows, int32_t* data)
{
    readBlock(0, yoff, xsize, nrows, data);
}

/*----------------------------------------------------------------------------
 * readBlock
 *----------------------------------------------------------------------------*/
void GdalRaster::readBlock(int x, int y, int ncols, int nrows, int32_t* data)
{
    if(dset == NULL) open();

    if(x < 0 || y < 0 || ncols <= 0 || nrows <= 0 || (x + ncols) > xsize || (y + nrows) > ysize)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "Read window (%d, %d) %d x %d outside of raster %s",
                               x, y, ncols, nrows, fileName.c_str());
    }

    readWithRetry(x, y, ncols, nrows, data);
}

/*----------------------------------------------------------------------------
 * isSparse
 *
 *  True when the window is a hole in a sparse raster (nothing stored on disk)
 *----------------------------------------------------------------------------*/
bool GdalRaster::isSparse(int x, int y, int ncols, int nrows)
{
    if(dset == NULL) open();

    double pct = 0.0;
    const int flags = band->GetDataCoverageStatus(x, y, ncols, nrows, 0, &pct);
    return (flags == GDAL_DATA_COVERAGE_STATUS_EMPTY) && (pct == 0.0);
}

/*----------------------------------------------------------------------------
 * getPalette
 *----------------------------------------------------------------------------*/
bool GdalRaster::getPalette(std::vector<rgba_t>& palette) const
{
    palette.clear();
    if(band == NULL) return false;

    const GDALColorTable* ctable = band->GetColorTable();
    if(ctable == NULL) return false;

    const int count = ctable->GetColorEntryCount();
    palette.reserve(count);
    for(int i = 0; i < count; i++)
    {
        const GDALColorEntry* entry = ctable->GetColorEntry(i);
        rgba_t color = {0, 0, 0, 0};
        if(entry)
        {
            color.r = entry->c1;
            color.g = entry->c2;
            color.b = entry->c3;
            color.a = entry->c4;
        }
        palette.push_back(color);
    }

    return true;
}

/*----------------------------------------------------------------------------
 * exists
 *----------------------------------------------------------------------------*/
bool GdalRaster::exists(const std::string& fileName)
{
    VSIStatBufL sbuf;
    return VSIStatL(fileName.c_str(), &sbuf) == 0;
}

/*----------------------------------------------------------------------------
 * writeRaster
 *
 *  Creates a single band raster from a row major buffer of values
 *----------------------------------------------------------------------------*/
void GdalRaster::writeRaster(const std::string& fileName, const char* driverName,
                             int cols, int rows, const double* geoTransform,
                             const int32_t* data, GDALDataType dtype,
                             char** options, const std::vector<rgba_t>* palette)
{
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driverName);
    CHECKPTR(driver);

    GDALDataset* outDset = driver->Create(fileName.c_str(), cols, rows, 1, dtype, options);
    if(outDset == NULL)
        throw RunTimeException(CRITICAL, RTE_ERROR, "Failed to create raster: %s", fileName.c_str());

    try
    {
        CHECK_GDALERR(outDset->SetGeoTransform(const_cast<double*>(geoTransform)));

        OGRSpatialReference srs;
        srs.SetWellKnownGeogCS("WGS84");
        CHECK_GDALERR(outDset->SetSpatialRef(&srs));

        GDALRasterBand* outBand = outDset->GetRasterBand(1);
        CHECKPTR(outBand);

        if(palette)
        {
            GDALColorTable ctable;
            for(size_t i = 0; i < palette->size(); i++)
            {
                const rgba_t& c = (*palette)[i];
                const GDALColorEntry entry = {c.r, c.g, c.b, c.a};
                ctable.SetColorEntry(static_cast<int>(i), &entry);
            }
            CHECK_GDALERR(outBand->SetColorTable(&ctable));
        }

        const CPLErr err = outBand->RasterIO(GF_Write, 0, 0, cols, rows, const_cast<int32_t*>(data), cols, rows, GDT_Int32, 0, 0, NULL);
        CHECK_GDALERR(err);
    }
    catch(const RunTimeException&)
    {
        GDALClose(outDset);
        throw;
    }

    /* Flush to disk */
    GDALClose(outDset);
    mlog(DEBUG, "Created raster %s (%d x %d)", fileName.c_str(), cols, rows);
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * readWithRetry
 *----------------------------------------------------------------------------*/
void GdalRaster::readWithRetry(int x, int y, int _xsize, int _ysize, int32_t* data)
{
    /*
     * Reads from network or busy storage occasionally fail with no useful
     * error code, so a failed read is always retried once.
     */
    int cnt = 1;
    CPLErr err = CE_None;
    while(true)
    {
        /* Retry read if error */
        err = band->RasterIO(GF_Read, x, y, _xsize, _ysize, data, _xsize, _ysize, GDT_Int32, 0, 0, NULL);
        if(err != CE_None && cnt--) retrySleep();
        else break;
    }

    if (err != CE_None)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "RasterIO call failed on %s: %d", fileName.c_str(), err);
    }
}
