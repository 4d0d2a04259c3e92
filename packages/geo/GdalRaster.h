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

#ifndef __gdal_raster__
#define __gdal_raster__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "EventLib.h"

#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <string>
#include <thread>
#include <vector>

/******************************************************************************
 * Typedef and macros used by GDAL class
 ******************************************************************************/

#define CHECKPTR(p)                                                           \
do                                                                            \
{                                                                             \
    if ((p) == NULL)                                                          \
    {                                                                         \
        throw RunTimeException(CRITICAL, RTE_ERROR,                           \
              "NULL pointer detected (%s():%d)", __FUNCTION__, __LINE__);     \
    }                                                                         \
} while (0)


#define CHECK_GDALERR(e)                                                      \
do                                                                            \
{                                                                             \
    if ((e))   /* CPLErr and OGRErr types have 0 for no error  */             \
    {                                                                         \
        throw RunTimeException(CRITICAL, RTE_ERROR,                           \
              "GDAL ERROR detected: %d (%s():%d)", e, __FUNCTION__, __LINE__);\
    }                                                                         \
} while (0)

/******************************************************************************
 * GDAL RASTER CLASS
 ******************************************************************************/

class GdalRaster
{
    public:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef struct {
            double lon_min;
            double lat_min;
            double lon_max;
            double lat_max;
        } bbox_t;

        typedef struct {
            short r;
            short g;
            short b;
            short a;
        } rgba_t;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        explicit           GdalRaster     (const std::string& _fileName);
        virtual           ~GdalRaster     (void);
        void               open           (void);
        void               close          (void);
        bool               isOpen         (void) const { return dset != NULL; }
        void               readRows       (int yoff, int nrows, int32_t* data);
        void               readBlock      (int x, int y, int ncols, int nrows, int32_t* data);
        bool               isSparse       (int x, int y, int ncols, int nrows);
        bool               getPalette     (std::vector<rgba_t>& palette) const;
        const std::string& getFileName    (void) const { return fileName; }
        int                getRows        (void) const { return ysize; }
        int                getCols        (void) const { return xsize; }
        int                getBlockXSize  (void) const { return xblocksize; }
        int                getBlockYSize  (void) const { return yblocksize; }
        const bbox_t&      getBbox        (void) const { return bbox; }
        const double*      getGeoTransform(void) const { return geoTransform; }
        GDALDataset*       getDataset     (void) { return dset; }

        /*--------------------------------------------------------------------
         * Static Methods
         *--------------------------------------------------------------------*/

        static bool        exists         (const std::string& fileName);
        static void        writeRaster    (const std::string& fileName, const char* driverName,
                                           int cols, int rows, const double* geoTransform,
                                           const int32_t* data, GDALDataType dtype,
                                           char** options=NULL, const std::vector<rgba_t>* palette=NULL);

    private:

        /*--------------------------------------------------------------------
        * Data
        *--------------------------------------------------------------------*/

        std::string     fileName;
        GDALDataset    *dset;
        GDALRasterBand *band;
        int             xsize;
        int             ysize;
        int             xblocksize;
        int             yblocksize;
        bbox_t          bbox;
        double          geoTransform[6];

        /*--------------------------------------------------------------------
        * Methods
        *--------------------------------------------------------------------*/

        void        readWithRetry        (int x, int y, int _xsize, int _ysize, int32_t* data);
        static void retrySleep           (void) {std::this_thread::sleep_for(std::chrono::milliseconds(50));}
};

#endif  /* __gdal_raster__ */
