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

#include "ClassTables.h"

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

/*
 * Mappings come from the legend.txt file distributed with
 * https://www.nature.com/articles/sdata2018214.pdf (http://www.gloh2o.org/koppen/)
 */
const ClassTables::color_class_t ClassTables::KG_COLORS[] = {
    {  0,   0, 255, "Af"},  {  0, 120, 255, "Am"},  { 70, 170, 250, "Aw"},
    {255,   0,   0, "BWh"}, {255, 150, 150, "BWk"}, {245, 165,   0, "BSh"},
    {255, 220, 100, "BSk"},
    {255, 255,   0, "Csa"}, {200, 200,   0, "Csb"}, {150, 150,   0, "Csc"},
    {150, 255, 150, "Cwa"}, {100, 200, 100, "Cwb"}, { 50, 150,  50, "Cwc"},
    {200, 255,  80, "Cfa"}, {100, 255,  80, "Cfb"}, { 50, 200,   0, "Cfc"},
    {255,   0, 255, "Dsa"}, {200,   0, 200, "Dsb"}, {150,  50, 150, "Dsc"},
    {150, 100, 150, "Dsd"}, {170, 175, 255, "Dwa"}, { 90, 120, 220, "Dwb"},
    { 75,  80, 180, "Dwc"}, { 50,   0, 135, "Dwd"}, {  0, 255, 255, "Dfa"},
    { 55, 200, 255, "Dfb"}, {  0, 125, 125, "Dfc"}, {  0,  70,  95, "Dfd"},
    {178, 178, 178, "ET"},  {102, 102, 102, "EF"}
};
const int ClassTables::NUM_KG_COLORS = sizeof(KG_COLORS) / sizeof(color_class_t);

/*
 * The shipped GeoTIFF is greyscale with no color table; the RGB swatches were
 * chosen so that the grey value of each pixel is its LCCS class.
 * http://maps.elie.ucl.ac.be/CCI/viewer/download/ESACCI-LC-Legend.csv
 */
const int ClassTables::ESA_LCCS_CODES[] = {
     10,  11,  12,  20,  30,  40,  50,  60,  61,  62,
     70,  71,  72,  80,  81,  82,  90, 100, 110, 120,
    121, 122, 130, 140, 150, 151, 152, 153, 160, 170,
    180, 190, 200, 201, 202, 210, 220
};
const int ClassTables::NUM_ESA_LCCS_CODES = sizeof(ESA_LCCS_CODES) / sizeof(int);

const ClassTables::coded_class_t ClassTables::FAO_LAND_COVERS[] = {
    { 1, "Artificial Surfaces"},
    { 2, "Cropland"},
    { 3, "Grassland"},
    { 4, "Tree Covered Areas"},
    { 5, "Shrubs Covered Areas"},
    { 6, "Herbaceous vegetation, aquatic or regularly flooded"},
    { 7, "Mangroves"},
    { 8, "Sparse vegetation"},
    { 9, "Baresoil"},
    {10, "Snow and glaciers"},
    {11, "Waterbodies"}
};
const int ClassTables::NUM_FAO_LAND_COVERS = sizeof(FAO_LAND_COVERS) / sizeof(coded_class_t);

/* Geomorpho90m slope pre-classified into these buckets */
const char* ClassTables::GAEZ_SLOPES[] = {
    "0-0.5%", "0.5-2%", "2-5%", "5-8%", "8-16%", "16-30%", "30-45%", ">45%"
};
const int ClassTables::NUM_GAEZ_SLOPES = sizeof(GAEZ_SLOPES) / sizeof(const char*);
