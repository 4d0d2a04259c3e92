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

#include <algorithm>
#include <cmath>
#include <gdal.h>
#include <gdal_utils.h>
#include <cpl_string.h>
#include <ogr_spatialref.h>
#include <uuid/uuid.h>

#include "GeoLib.h"
#include "GdalRaster.h"
#include "EventLib.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const double GeoLib::EQUATORIAL_RADIUS_KM = 6378.137;
const double GeoLib::ECCENTRICITY_SQUARED = 0.00669437999014;
const char*  GeoLib::SHAPEFILE_DRIVER = "ESRI Shapefile";
const char*  GeoLib::GEOTIFF_DRIVER = "GTiff";

/******************************************************************************
 * PixelArea Subclass
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
GeoLib::PixelArea::PixelArea(const double* geoTransform):
    yTopDeg(geoTransform[3]),
    xSizeDeg(geoTransform[1]),
    ySizeDeg(geoTransform[5]),
    yRad(fabs(geoTransform[5]) * M_PI / 180.0)
{
}

/*----------------------------------------------------------------------------
 * rowKm2
 *----------------------------------------------------------------------------*/
double GeoLib::PixelArea::rowKm2(int row) const
{
    return pixelKm2(rowCenter(row), xSizeDeg, ySizeDeg);
}

/*----------------------------------------------------------------------------
 * blockKm2
 *
 *  Fills a row major nrows x ncols grid; every column of row i holds the
 *  area of a pixel in raster row yoff + i
 *----------------------------------------------------------------------------*/
void GeoLib::PixelArea::blockKm2(int yoff, int nrows, int ncols, std::vector<double>& grid) const
{
    grid.resize(static_cast<size_t>(nrows) * ncols);

    double y = rowCenter(yoff);
    for(int i = 0; i < nrows; i++)
    {
        const double km2 = pixelKm2(y, xSizeDeg, ySizeDeg);
        double* row = &grid[static_cast<size_t>(i) * ncols];
        for(int j = 0; j < ncols; j++) row[j] = km2;
        y -= yRad;
    }
}

/*----------------------------------------------------------------------------
 * rowCenter
 *
 *  Step down from the top latitude by whole pixel heights, then back off
 *  half a pixel height to land on the row's center
 *----------------------------------------------------------------------------*/
double GeoLib::PixelArea::rowCenter(int row) const
{
    return ((yTopDeg + (row * ySizeDeg)) * M_PI / 180.0) - (yRad / 2.0);
}

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * pixelKm2
 *----------------------------------------------------------------------------*/
double GeoLib::pixelKm2(double latCenterRad, double xSizeDeg, double ySizeDeg)
{
    const double xlen = fabs(xSizeDeg) * degreeLonKm(latCenterRad);
    const double ylen = fabs(ySizeDeg) * degreeLatKm(latCenterRad);
    return xlen * ylen;
}

/*----------------------------------------------------------------------------
 * degreeLonKm
 *
 *  https://en.wikipedia.org/wiki/Longitude#Length_of_a_degree_of_longitude
 *----------------------------------------------------------------------------*/
double GeoLib::degreeLonKm(double latRad)
{
    const double s = sin(latRad);
    return (cos(latRad) * M_PI * EQUATORIAL_RADIUS_KM) / (180.0 * sqrt(1.0 - (ECCENTRICITY_SQUARED * s * s)));
}

/*----------------------------------------------------------------------------
 * degreeLatKm
 *
 *  https://en.wikipedia.org/wiki/Latitude#Length_of_a_degree_of_latitude
 *----------------------------------------------------------------------------*/
double GeoLib::degreeLatKm(double latRad)
{
    return 111.132954 - (0.559822 * cos(2.0 * latRad)) + (0.001175 * cos(4.0 * latRad));
}

/*----------------------------------------------------------------------------
 * getUUID
 *----------------------------------------------------------------------------*/
std::string GeoLib::getUUID(void)
{
    char uuid_str[UUID_STR_LEN];
    uuid_t uuid;
    uuid_generate(uuid);
    uuid_unparse_lower(uuid, uuid_str);
    return std::string(uuid_str);
}

/*----------------------------------------------------------------------------
 * makeRectangle
 *----------------------------------------------------------------------------*/
OGRPolygon GeoLib::makeRectangle(double minx, double miny, double maxx, double maxy)
{
    OGRPolygon poly;
    OGRLinearRing lr;

    /* Clockwise for interior of polygon */
    lr.addPoint(minx, miny);
    lr.addPoint(minx, maxy);
    lr.addPoint(maxx, maxy);
    lr.addPoint(maxx, miny);
    lr.addPoint(minx, miny);
    poly.addRing(&lr);
    return poly;
}

/*----------------------------------------------------------------------------
 * writeFeatureLayer
 *
 *  Creates a polygon layer holding a single feature with the given geometry.
 *  The dataset is closed before returning so the file is complete on disk.
 *----------------------------------------------------------------------------*/
void GeoLib::writeFeatureLayer(const std::string& fileName, const OGRGeometry* geom, const OGRSpatialReference* srs)
{
    CHECKPTR(geom);

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(SHAPEFILE_DRIVER);
    CHECKPTR(driver);

    GDALDataset* dset = driver->Create(fileName.c_str(), 0, 0, 0, GDT_Unknown, NULL);
    if(dset == NULL)
        throw RunTimeException(CRITICAL, RTE_ERROR, "Failed to create feature layer: %s", fileName.c_str());

    OGRFeature* feature = NULL;
    try
    {
        OGRSpatialReference* layerSrs = srs ? srs->Clone() : NULL;
        OGRLayer* layer = dset->CreateLayer("feature", layerSrs, wkbPolygon, NULL);
        if(layerSrs) layerSrs->Release();
        CHECKPTR(layer);

        feature = OGRFeature::CreateFeature(layer->GetLayerDefn());
        CHECKPTR(feature);
        CHECK_GDALERR(feature->SetGeometry(geom));
        CHECK_GDALERR(layer->CreateFeature(feature));
    }
    catch(const RunTimeException&)
    {
        if(feature) OGRFeature::DestroyFeature(feature);
        GDALClose(dset);
        throw;
    }

    /* Close datasets; the shapefile writer finishes its work on close */
    OGRFeature::DestroyFeature(feature);
    GDALClose(dset);
    mlog(DEBUG, "Created %s", fileName.c_str());
}

/*----------------------------------------------------------------------------
 * cutlineOverlaps
 *
 *  Compares the envelope of the cutline, in the raster's coordinate system,
 *  with the extent of the raster. A cutline that cannot be transformed is
 *  reported as overlapping and left to the warp.
 *----------------------------------------------------------------------------*/
bool GeoLib::cutlineOverlaps(GDALDataset* srcDset, const OGRGeometry* geom, const OGRSpatialReference* srs)
{
    CHECKPTR(srcDset);
    CHECKPTR(geom);

    double gt[6];
    CHECK_GDALERR(srcDset->GetGeoTransform(gt));

    const double x0 = gt[0];
    const double x1 = gt[0] + gt[1] * srcDset->GetRasterXSize();
    const double y0 = gt[3];
    const double y1 = gt[3] + gt[5] * srcDset->GetRasterYSize();

    OGREnvelope extent;
    extent.MinX = std::min(x0, x1);
    extent.MaxX = std::max(x0, x1);
    extent.MinY = std::min(y0, y1);
    extent.MaxY = std::max(y0, y1);

    OGREnvelope envelope;
    const OGRSpatialReference* rasterSrs = srcDset->GetSpatialRef();
    if(srs && rasterSrs && !srs->IsSame(rasterSrs))
    {
        OGRCoordinateTransformation* transform = OGRCreateCoordinateTransformation(srs, rasterSrs);
        if(transform == NULL)
        {
            mlog(DEBUG, "No transformation from the boundary to the raster coordinate system");
            return true;
        }

        OGRGeometry* cutline = geom->clone();
        const OGRErr err = cutline->transform(transform);
        OGRCoordinateTransformation::DestroyCT(transform);
        if(err != OGRERR_NONE)
        {
            delete cutline;
            return true;
        }

        cutline->getEnvelope(&envelope);
        delete cutline;
    }
    else
    {
        geom->getEnvelope(&envelope);
    }

    return envelope.Intersects(extent);
}

/*----------------------------------------------------------------------------
 * warpToCutline
 *
 *  Clips the source raster to the cutline and crops the output to the
 *  cutline extent. Returns false when nothing was produced (the cutline does
 *  not intersect the raster). The output is closed before returning.
 *----------------------------------------------------------------------------*/
bool GeoLib::warpToCutline(GDALDataset* srcDset, const std::string& dstFile, const std::string& cutlineFile, bool allTouched)
{
    CHECKPTR(srcDset);

    char** argv = NULL;
    argv = CSLAddString(argv, "-of");
    argv = CSLAddString(argv, GEOTIFF_DRIVER);
    argv = CSLAddString(argv, "-cutline");
    argv = CSLAddString(argv, cutlineFile.c_str());
    argv = CSLAddString(argv, "-crop_to_cutline");
    if(allTouched)
    {
        argv = CSLAddString(argv, "-wo");
        argv = CSLAddString(argv, "CUTLINE_ALL_TOUCHED=TRUE");
    }

    GDALWarpAppOptions* options = GDALWarpAppOptionsNew(argv, NULL);
    CSLDestroy(argv);
    CHECKPTR(options);

    GDALDatasetH srcHandle = static_cast<GDALDatasetH>(srcDset);
    int usageError = FALSE;
    GDALDatasetH dstHandle = GDALWarp(dstFile.c_str(), NULL, 1, &srcHandle, options, &usageError);
    GDALWarpAppOptionsFree(options);

    if(dstHandle == NULL)
    {
        mlog(DEBUG, "Warp to %s produced no output (usage error: %d)", dstFile.c_str(), usageError);
        return false;
    }

    const bool empty = (GDALGetRasterXSize(dstHandle) == 0) || (GDALGetRasterYSize(dstHandle) == 0);

    /* Flush the warped raster before anyone reopens it */
    GDALClose(dstHandle);

    return !empty;
}

/*----------------------------------------------------------------------------
 * deleteDataset
 *----------------------------------------------------------------------------*/
void GeoLib::deleteDataset(const std::string& fileName, const char* driverName)
{
    VSIStatBufL sbuf;
    if(VSIStatL(fileName.c_str(), &sbuf) != 0) return;

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driverName);
    if(driver == NULL || driver->Delete(fileName.c_str()) != CE_None)
    {
        if(VSIUnlink(fileName.c_str()) != 0)
        {
            mlog(WARNING, "Failed to delete %s", fileName.c_str());
        }
    }
}
