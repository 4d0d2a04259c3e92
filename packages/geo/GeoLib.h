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

#ifndef __geo_lib__
#define __geo_lib__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"

#include <ogrsf_frmts.h>
#include <string>
#include <vector>

/******************************************************************************
 * GEO LIBRARY CLASS
 ******************************************************************************/

class GeoLib
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const double EQUATORIAL_RADIUS_KM;   // WGS84 semi-major axis
        static const double ECCENTRICITY_SQUARED;   // WGS84 first eccentricity squared
        static const char*  SHAPEFILE_DRIVER;
        static const char*  GEOTIFF_DRIVER;

        /*--------------------------------------------------------------------
         * PixelArea Subclass
         *
         *  Surface area of the pixels of a north-up raster with a linear
         *  geotransform in degrees. Pixel area only depends on latitude so
         *  every pixel in a row covers the same number of square kilometers.
         *--------------------------------------------------------------------*/

        class PixelArea
        {
            public:
                explicit PixelArea  (const double* geoTransform);
                double  rowKm2      (int row) const;
                void    blockKm2    (int yoff, int nrows, int ncols, std::vector<double>& grid) const;
            private:
                double  yTopDeg;    // latitude of the top edge of row 0
                double  xSizeDeg;   // signed pixel width
                double  ySizeDeg;   // signed pixel height
                double  yRad;       // pixel height in radians
                double  rowCenter   (int row) const;
        };

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        static double       pixelKm2            (double latCenterRad, double xSizeDeg, double ySizeDeg);
        static double       degreeLonKm         (double latRad);
        static double       degreeLatKm         (double latRad);
        static std::string  getUUID             (void);
        static OGRPolygon   makeRectangle       (double minx, double miny, double maxx, double maxy);
        static void         writeFeatureLayer   (const std::string& fileName, const OGRGeometry* geom, const OGRSpatialReference* srs);
        static bool         cutlineOverlaps     (GDALDataset* srcDset, const OGRGeometry* geom, const OGRSpatialReference* srs);
        static bool         warpToCutline       (GDALDataset* srcDset, const std::string& dstFile, const std::string& cutlineFile, bool allTouched);
        static void         deleteDataset       (const std::string& fileName, const char* driverName);
};

#endif /* __geo_lib__ */
