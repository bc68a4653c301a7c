/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#define BOXOFFICE_LEDGER_VERSION "1.0.0"

#define BOXOFFICE_MAX_NESTED_OBJECTS (200)

/** Upper bound of any single amount, keeps every price, fee and revenue sum inside int64 */
#define BOXOFFICE_MAX_SHARE_SUPPLY int64_t(1000000000000000ll)

/** Percent of every sale that accrues to the treasury as platform fee */
#define BOXOFFICE_PLATFORM_FEE_PERCENT                    5
#define BOXOFFICE_100_PERCENT                             100

/**
 * The demand uplift is price * (sold percent) / divisor, so a sold out event
 * costs half again its base price.
 */
#define BOXOFFICE_DEMAND_UPLIFT_DIVISOR                   200

#define BOXOFFICE_MAX_BATCH_SIZE                          10
#define BOXOFFICE_LARGE_GROUP_SIZE                        10
#define BOXOFFICE_LARGE_GROUP_DISCOUNT_PERCENT            15
#define BOXOFFICE_SMALL_GROUP_SIZE                        5
#define BOXOFFICE_SMALL_GROUP_DISCOUNT_PERCENT            10

#define BOXOFFICE_MAX_ACCOUNT_NAME_LENGTH                 63
#define BOXOFFICE_MAX_EVENT_NAME_LENGTH                   100
#define BOXOFFICE_MAX_EVENT_DESCRIPTION_LENGTH            500
#define BOXOFFICE_MAX_VENUE_LENGTH                        100
#define BOXOFFICE_MAX_EVENT_TYPE_LENGTH                   50
#define BOXOFFICE_MAX_SEAT_INFO_LENGTH                    50

#define BOXOFFICE_DEFAULT_TREASURY_ACCOUNT                "treasury"
