/* 
 * File:   SdsEnums.hpp
 * Author: me
 *
 * Created on March 2, 2024, 9:15 PM
 */

#ifndef SDSENUMS_HPP
#define	SDSENUMS_HPP

namespace sdsclient
{
    enum Request_Type
    {
        GET,
        POST,
        PUT,
        PATCH,
        DELETE,
        HEAD
    };

    /*
     * What the server does when the uploaded name already exists in the 
     * destination.
     */
    enum Resolution_Strategy
    {
        RESOLUTION_AUTORENAME,
        RESOLUTION_OVERWRITE,
        RESOLUTION_FAIL
    };

    enum Upload_State
    {
        UPLOAD_TRANSFER,
        UPLOAD_FINISHING,
        UPLOAD_DONE,
        UPLOAD_ERROR
    };

    enum Node_Type
    {
        NODE_ROOM,
        NODE_FOLDER,
        NODE_FILE
    };

    enum Log_Level
    {
        LEVEL_TRACE,
        LEVEL_DEBUG,
        LEVEL_INFO,
        LEVEL_WARNING,
        LEVEL_ERROR,
        LEVEL_FATAL
    };
}


#endif	/* SDSENUMS_HPP */
