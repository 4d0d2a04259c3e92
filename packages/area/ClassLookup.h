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

#ifndef __class_lookup__
#define __class_lookup__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "GdalRaster.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

/******************************************************************************
 * TYPEDEFS
 ******************************************************************************/

typedef std::string class_key_t;

/******************************************************************************
 * CLASS LOOKUP
 *
 *  Maps raw pixel values to classification keys. A lookup is immutable once
 *  constructed and may be shared between aggregation threads.
 ******************************************************************************/

class ClassLookup
{
    public:

        /*--------------------------------------------------------------------
         * Constants
         *--------------------------------------------------------------------*/

        static const char* KG;
        static const char* ESA_LC;
        static const char* FAO_LC;
        static const char* SLOPE;
        static const char* WORKABILITY;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        virtual                         ~ClassLookup    (void) = default;

        /* returns false when the value is no-data */
        virtual bool                    classify        (int32_t value, class_key_t& key) const = 0;

        const std::vector<class_key_t>& columns         (void) const { return keys; }
        bool                            allTouched      (void) const { return touched; }
        const char*                     getName         (void) const { return name.c_str(); }

        static ClassLookup*             create          (const char* type, GdalRaster* raster);

    protected:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

                                        ClassLookup     (const char* _name, bool _touched);

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        std::vector<class_key_t>        keys;

    private:

        std::string                     name;
        bool                            touched;
};

/******************************************************************************
 * PALETTE LOOKUP
 *
 *  Pixel value indexes the raster's color table; the color selects the class
 ******************************************************************************/

class PaletteLookup: public ClassLookup
{
    public:

        PaletteLookup (const char* _name, const std::vector<GdalRaster::rgba_t>& palette, bool _touched);
        bool classify (int32_t value, class_key_t& key) const override;

    private:

        /* class index per palette entry, -1 for entries that are not a class */
        std::vector<int> paletteClass;
};

/******************************************************************************
 * DIRECT LOOKUP
 *
 *  Pixel value is the class code; zero is no-data
 ******************************************************************************/

class DirectLookup: public ClassLookup
{
    public:

        typedef std::vector<std::pair<int32_t, class_key_t>> code_list_t;

        DirectLookup (const char* _name, const code_list_t& codes, bool _touched);
        bool classify (int32_t value, class_key_t& key) const override;

        static code_list_t decimalCodes (const std::vector<int32_t>& values);

    private:

        std::map<int32_t, int> codeIndex;
};

/******************************************************************************
 * BUCKET LOOKUP
 *
 *  Pixel value indexes an ordered list of bucket labels; 255 is no-data
 ******************************************************************************/

class BucketLookup: public ClassLookup
{
    public:

        static const int32_t NO_DATA = 255;

        BucketLookup (const char* _name, const std::vector<class_key_t>& buckets, bool _touched);
        bool classify (int32_t value, class_key_t& key) const override;
};

/******************************************************************************
 * CODED LOOKUP
 *
 *  Pixel value is a code into a label table; 0 and 255 are no-data
 ******************************************************************************/

class CodedLookup: public DirectLookup
{
    public:

        static const int32_t NO_DATA = 255;

        CodedLookup (const char* _name, const code_list_t& codes, bool _touched);
        bool classify (int32_t value, class_key_t& key) const override;
};

#endif  /* __class_lookup__ */
