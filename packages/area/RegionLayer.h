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

#ifndef __region_layer__
#define __region_layer__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "RegionNames.h"

#include <ogrsf_frmts.h>
#include <string>
#include <vector>

/******************************************************************************
 * REGION FEATURE CLASS
 *
 *  Copy of one boundary polygon with its resolved region name. Features are
 *  cloned out of the layer so worker threads never touch OGR layer state.
 ******************************************************************************/

class RegionFeature
{
    public:

        RegionFeature   (int _index, const char* _admin, const char* _a3, const OGRGeometry* geom);
        ~RegionFeature  (void);

        int             index;      // position of the feature in the layer
        std::string     admin;      // name as found in the layer
        std::string     a3;         // sovereign code, used to name scratch and mask files
        std::string     region;     // canonical name, empty when unresolved
        bool            resolved;
        OGRGeometry*    geometry;

    private:

        RegionFeature (const RegionFeature&);
        RegionFeature& operator= (const RegionFeature&);
};

/******************************************************************************
 * REGION LAYER CLASS
 ******************************************************************************/

class RegionLayer
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const char* ADMIN_FIELD;
        static const char* SOV_A3_FIELD;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        explicit                    RegionLayer     (const RegionNames& _names);
                                    ~RegionLayer    (void);

        void                        load            (const std::string& fileName);
        void                        add             (const char* admin, const char* a3, const OGRGeometry* geom);
        void                        setSpatialRef   (const OGRSpatialReference* _srs);

        int                         length          (void) const { return static_cast<int>(features.size()); }
        const RegionFeature&        get             (int i) const { return *features[i]; }
        const OGRSpatialReference*  getSpatialRef   (void) const { return srs; }
        int                         numResolved     (void) const;

    private:

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        const RegionNames&          names;
        std::vector<RegionFeature*> features;
        OGRSpatialReference*        srs;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        void                        clear           (void);
};

#endif  /* __region_layer__ */
