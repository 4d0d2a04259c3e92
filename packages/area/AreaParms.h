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

#ifndef __area_parms__
#define __area_parms__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "LuaObject.h"
#include "AreaWriter.h"
#include "RegionNames.h"

#include <map>
#include <string>
#include <vector>

/******************************************************************************
 * AREA PARAMETERS CLASS
 *
 *  Run configuration read from the table returned by the configuration
 *  script. Missing scalar fields keep their defaults; dataset entries are
 *  validated as they are read.
 ******************************************************************************/

class AreaParms: public LuaObject
{
    public:

        /*--------------------------------------------------------------------
        * Constants
        *--------------------------------------------------------------------*/

        static const char* SELF;
        static const char* BOUNDARIES;
        static const char* RESULTS;
        static const char* MASKS;
        static const char* THREADS;
        static const char* GDAL_CACHEMAX;
        static const char* LOG_LEVEL;
        static const char* SKIP_SPARSE;
        static const char* PRECISION;
        static const char* INDEX_NAME;
        static const char* DATASETS;
        static const char* REGIONS;
        static const char* ALIASES;
        static const char* EXCLUDE;
        static const char* RASTER;
        static const char* OUTPUT;
        static const char* LOOKUP;
        static const char* METHOD;
        static const char* OPTIONAL;
        static const char* CLIP_METHOD;
        static const char* MASK_METHOD;

        static const char* LAND_COVER_FLAG;
        static const char* KOPPEN_GEIGER_FLAG;
        static const char* SLOPE_FLAG;
        static const char* WORKABILITY_FLAG;
        static const char* DATASET_FLAGS[];
        static const int   NUM_DATASET_FLAGS = 4;

        static const int   DEFAULT_THREADS = 1;
        static const int   DEFAULT_GDAL_CACHEMAX = 128;

        static const char* OBJECT_TYPE;
        static const char* LUA_META_NAME;
        static const struct luaL_Reg LUA_META_TABLE[];

        /*--------------------------------------------------------------------
        * Typedefs
        *--------------------------------------------------------------------*/

        typedef enum {
            VECTOR_CLIP = 0,
            MASK_BLOCK = 1
        } method_t;

        typedef struct {
            std::string raster;         // classification raster
            std::string output;         // csv file name inside the results directory
            std::string lookup;         // ClassLookup type
            method_t    method;
            bool        optional;       // skip quietly when the raster is missing
        } dataset_t;

        typedef std::vector<dataset_t> dataset_list_t;

        /*--------------------------------------------------------------------
        * Data
        *--------------------------------------------------------------------*/

        std::string                             boundaries;
        std::string                             results;
        std::string                             masks;
        int                                     threads;
        int                                     gdal_cachemax;
        event_level_t                           log_level;
        bool                                    skip_sparse;
        AreaWriter::OutputFormat                format;
        RegionNames                             names;
        std::map<std::string, dataset_list_t>   datasets;

        /*--------------------------------------------------------------------
        * Methods
        *--------------------------------------------------------------------*/

        static int              luaCreate       (lua_State* L);
                                AreaParms       (lua_State* L, int index);
                                ~AreaParms      (void) override = default;

        const dataset_list_t&   getDatasets     (const char* flag) const;
        static bool             isFlag          (const char* flag);

    private:

        /*--------------------------------------------------------------------
        * Data
        *--------------------------------------------------------------------*/

        static const dataset_list_t emptyList;

        /*--------------------------------------------------------------------
        * Methods
        *--------------------------------------------------------------------*/

        void                    getLuaDatasets  (lua_State* L, int index);
        void                    getLuaRegions   (lua_State* L, int index);
        static dataset_t        getLuaDataset   (lua_State* L, int index, const char* flag, int entry);
        static int              luaNumDatasets  (lua_State* L);
};

#endif  /* __area_parms__ */
