#ifndef SPVD_SPVD_H
#define SPVD_SPVD_H
#pragma once

/** Result codes reported in request envelopes */
#define SPVD_OK 0
#define SPVD_ERROR (-1)
#define SPVD_NOT_FOUND (-2)
#define SPVD_STORAGE_ERROR (-3)
#define SPVD_INTERNAL_ERROR (-4)

/** Session modes */
#define SPVD_MODE_ONLINE "online"
#define SPVD_MODE_OFFLINE "offline"

/** Seconds subtracted from a rescan time to absorb clock skew (one week) */
#define SPVD_RESCAN_MARGIN 604800

#endif
