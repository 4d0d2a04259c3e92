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

#include "ClassLookup.h"
#include "ClassTables.h"
#include "EventLib.h"
#include "StringLib.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* ClassLookup::KG          = "kg";
const char* ClassLookup::ESA_LC      = "esa_lc";
const char* ClassLookup::FAO_LC      = "fao_lc";
const char* ClassLookup::SLOPE       = "slope";
const char* ClassLookup::WORKABILITY = "workability";

/******************************************************************************
 * CLASS LOOKUP METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * create
 *
 *  Builds the lookup for a dataset family; the raster is only needed by
 *  lookups that read the color table of the source
 *----------------------------------------------------------------------------*/
ClassLookup* ClassLookup::create(const char* type, GdalRaster* raster)
{
    if(type == NULL)
        throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "no lookup type supplied");

    if(StringLib::match(type, KG))
    {
        if(raster == NULL)
            throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "%s lookup requires a source raster", type);

        std::vector<GdalRaster::rgba_t> palette;
        if(!raster->isOpen()) raster->open();
        if(!raster->getPalette(palette))
            throw RunTimeException(CRITICAL, RTE_ERROR, "raster has no color table: %s", raster->getFileName().c_str());

        return new PaletteLookup(type, palette, true);
    }

    if(StringLib::match(type, ESA_LC))
    {
        const std::vector<int32_t> codes(ClassTables::ESA_LCCS_CODES, ClassTables::ESA_LCCS_CODES + ClassTables::NUM_ESA_LCCS_CODES);
        return new DirectLookup(type, DirectLookup::decimalCodes(codes), true);
    }

    if(StringLib::match(type, FAO_LC))
    {
        DirectLookup::code_list_t codes;
        for(int i = 0; i < ClassTables::NUM_FAO_LAND_COVERS; i++)
        {
            codes.push_back(std::make_pair(ClassTables::FAO_LAND_COVERS[i].code, class_key_t(ClassTables::FAO_LAND_COVERS[i].label)));
        }
        return new CodedLookup(type, codes, true);
    }

    if(StringLib::match(type, SLOPE))
    {
        const std::vector<class_key_t> buckets(ClassTables::GAEZ_SLOPES, ClassTables::GAEZ_SLOPES + ClassTables::NUM_GAEZ_SLOPES);
        return new BucketLookup(type, buckets, true);
    }

    if(StringLib::match(type, WORKABILITY))
    {
        std::vector<int32_t> codes;
        for(int code = ClassTables::WORKABILITY_MIN; code <= ClassTables::WORKABILITY_MAX; code++)
        {
            codes.push_back(code);
        }

        /* workability is the only dataset clipped to pixel centers */
        return new DirectLookup(type, DirectLookup::decimalCodes(codes), false);
    }

    throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "unknown lookup type: %s", type);
}

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
ClassLookup::ClassLookup(const char* _name, bool _touched):
    name(_name),
    touched(_touched)
{
}

/******************************************************************************
 * PALETTE LOOKUP METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
PaletteLookup::PaletteLookup(const char* _name, const std::vector<GdalRaster::rgba_t>& palette, bool _touched):
    ClassLookup(_name, _touched)
{
    for(int i = 0; i < ClassTables::NUM_KG_COLORS; i++)
    {
        keys.push_back(ClassTables::KG_COLORS[i].label);
    }

    /* Resolve every palette entry once */
    paletteClass.resize(palette.size(), -1);
    for(size_t p = 0; p < palette.size(); p++)
    {
        const GdalRaster::rgba_t& c = palette[p];

        /* white and black pixels are masked off */
        if((c.r == 255 && c.g == 255 && c.b == 255) || (c.r == 0 && c.g == 0 && c.b == 0))
        {
            continue;
        }

        for(int i = 0; i < ClassTables::NUM_KG_COLORS; i++)
        {
            const ClassTables::color_class_t& k = ClassTables::KG_COLORS[i];
            if(c.r == k.r && c.g == k.g && c.b == k.b)
            {
                paletteClass[p] = i;
                break;
            }
        }
    }

    mlog(DEBUG, "Created %s lookup from %ld palette entries", getName(), (long)palette.size());
}

/*----------------------------------------------------------------------------
 * classify
 *----------------------------------------------------------------------------*/
bool PaletteLookup::classify(int32_t value, class_key_t& key) const
{
    if(value < 0 || static_cast<size_t>(value) >= paletteClass.size())
        return false;

    const int index = paletteClass[value];
    if(index < 0) return false;

    key = keys[index];
    return true;
}

/******************************************************************************
 * DIRECT LOOKUP METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
DirectLookup::DirectLookup(const char* _name, const code_list_t& codes, bool _touched):
    ClassLookup(_name, _touched)
{
    for(const auto& code: codes)
    {
        if(codeIndex.find(code.first) != codeIndex.end())
            throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "duplicate code %d in %s lookup", code.first, _name);

        codeIndex[code.first] = static_cast<int>(keys.size());
        keys.push_back(code.second);
    }
}

/*----------------------------------------------------------------------------
 * classify
 *----------------------------------------------------------------------------*/
bool DirectLookup::classify(int32_t value, class_key_t& key) const
{
    if(value == 0) return false;

    const auto iter = codeIndex.find(value);
    if(iter == codeIndex.end()) return false;

    key = keys[iter->second];
    return true;
}

/*----------------------------------------------------------------------------
 * decimalCodes
 *----------------------------------------------------------------------------*/
DirectLookup::code_list_t DirectLookup::decimalCodes(const std::vector<int32_t>& values)
{
    code_list_t codes;
    for(const int32_t value: values)
    {
        codes.push_back(std::make_pair(value, StringLib::strfmt("%d", value)));
    }
    return codes;
}

/******************************************************************************
 * BUCKET LOOKUP METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
BucketLookup::BucketLookup(const char* _name, const std::vector<class_key_t>& buckets, bool _touched):
    ClassLookup(_name, _touched)
{
    keys = buckets;
}

/*----------------------------------------------------------------------------
 * classify
 *----------------------------------------------------------------------------*/
bool BucketLookup::classify(int32_t value, class_key_t& key) const
{
    if(value == NO_DATA) return false;
    if(value < 0 || static_cast<size_t>(value) >= keys.size()) return false;

    key = keys[value];
    return true;
}

/******************************************************************************
 * CODED LOOKUP METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
CodedLookup::CodedLookup(const char* _name, const code_list_t& codes, bool _touched):
    DirectLookup(_name, codes, _touched)
{
}

/*----------------------------------------------------------------------------
 * classify
 *----------------------------------------------------------------------------*/
bool CodedLookup::classify(int32_t value, class_key_t& key) const
{
    if(value == NO_DATA) return false;
    return DirectLookup::classify(value, key);
}
