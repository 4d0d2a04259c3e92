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

#ifndef __area_extractor__
#define __area_extractor__

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "OsApi.h"
#include "AreaParms.h"
#include "AreaMatrix.h"
#include "RegionLayer.h"
#include "ScratchDir.h"

#include <string>

/******************************************************************************
 * AREA EXTRACTOR CLASS
 *
 *  Runs the configured datasets of a flag: opens the source raster, builds
 *  its lookup, aggregates every region and writes one csv per dataset.
 *  A missing input stops the run; any other failure only loses its dataset.
 ******************************************************************************/

class AreaExtractor
{
    public:

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        explicit            AreaExtractor   (const AreaParms& _parms);
                            ~AreaExtractor  (void);

        int                 run             (const char* flag);
        void                runDataset      (const AreaParms::dataset_t& dataset);
        void                extract         (const AreaParms::dataset_t& dataset, AreaMatrix*& matrix);
        const RegionLayer&  getRegions      (void);
        const ScratchDir&   getScratch      (void) const { return scratch; }

    private:

        /*--------------------------------------------------------------------
         * Data
         *--------------------------------------------------------------------*/

        const AreaParms&    parms;
        ScratchDir          scratch;        // clip files of every dataset
        RegionLayer*        regions;

        /*--------------------------------------------------------------------
         * Methods
         *--------------------------------------------------------------------*/

        void                makeResultsDir  (void) const;
};

#endif  /* __area_extractor__ */
