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

#ifndef __class_tables__
#define __class_tables__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"

/******************************************************************************
 * CLASS TABLES
 ******************************************************************************/

class ClassTables
{
    public:

        /*--------------------------------------------------------------------
         * Typedefs
         *--------------------------------------------------------------------*/

        typedef struct {
            short       r;
            short       g;
            short       b;
            const char* label;
        } color_class_t;

        typedef struct {
            int         code;
            const char* label;
        } coded_class_t;

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        /* Köppen-Geiger legend colors, Beck et al. 2018 */
        static const color_class_t  KG_COLORS[];
        static const int            NUM_KG_COLORS;

        /* ESA CCI land cover LCCS classes; greyscale value equals the class */
        static const int            ESA_LCCS_CODES[];
        static const int            NUM_ESA_LCCS_CODES;

        /* FAO GLC-SHARE dominant land cover */
        static const coded_class_t  FAO_LAND_COVERS[];
        static const int            NUM_FAO_LAND_COVERS;

        /* GAEZ 3.0 slope buckets, indexed by pixel value */
        static const char*          GAEZ_SLOPES[];
        static const int            NUM_GAEZ_SLOPES;

        /* Workability classes are the integers 1 through 7 */
        static const int            WORKABILITY_MIN = 1;
        static const int            WORKABILITY_MAX = 7;
};

#endif  /* __class_tables__ */
