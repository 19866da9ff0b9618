/* 
 * File:   Util.hpp
 * Author: me
 *
 * Created on March 3, 2024, 3:32 PM
 */

#ifndef UTIL_HPP
#define	UTIL_HPP

#include <stdio.h>
#include <stdint.h>
#include <time.h>
#include <string>


namespace sdsclient
{
    class Util {
    public:
        /*
         * divideCeil():    Divide a dividend by a divisor. If there is a
         *                  remainder, round UP to the next integer.
         */
        static uint64_t divideCeil(uint64_t dividend, uint64_t divisor);
        
        /*
         * recursiveFopen():    Opens a file like fopen(), creating any missing
         *                      parent directories first. New files and 
         *                      directories are only accessible by the owner.
         * Return value:
         *      A valid FILE* handle on success, or NULL on failure.
         */
        static FILE* recursiveFopen(const std::string& path, 
                const std::string& mode);

        /*
         * recursiveMkdir():    mkdir() that also creates missing parents.
         * Return value (int):
         *      0 on success, -1 on failure (errno is set).
         */
        static int recursiveMkdir(const std::string& path);
        
        // Parses an unsigned decimal number starting at index. On exit, index
        // is the index of the first unprocessed character, or string::npos if
        // the entire string was processed.
        static uint64_t strtoull(const std::string& nstr, size_t& index);
        
        static std::string toString(uint64_t value);
        
        // Seconds since the epoch, formatted as "YYYY-MM-DDTHH:MM:SSZ"
        static std::string epochTimeToRfc3339(time_t t);
        
        static std::string base64Encode(const std::string& data);
        
        // Throws CryptoError if the input isn't valid base64
        static std::string base64Decode(const std::string& data);
        
        // base64 with the URL-safe alphabet and no '=' padding
        static std::string base64UrlEncodeNoPad(const std::string& data);
        
        /*
         * extractXmlElement(): Returns the text between <tag> and </tag>, or
         *                      an empty string if the element isn't present.
         *                      The predefined entities (&amp; &lt; &gt; 
         *                      &quot; &apos;) are decoded. Only meant for flat
         *                      documents such as S3 error bodies.
         */
        static std::string extractXmlElement(const std::string& xml, 
                const std::string& tag);
        
        /*
         * findHeader():    Looks up a header in the raw header block captured
         *                  from a response. The name is matched without regard
         *                  to case. If redirects produced several header 
         *                  blocks, the last matching header wins.
         */
        static std::string findHeader(const std::string& rawHeaders, 
                const std::string& name);
        
        // Total length from "bytes 0-0/1234". Returns false if not present.
        static bool parseContentRangeTotal(const std::string& contentRange, 
                uint64_t& total);
        
        // Removes surrounding double quotes (as found on ETag values)
        static std::string stripQuotes(const std::string& value);
        
        static std::string statusReason(long httpStatus);
        
    private:
        Util();
        Util(const Util& orig);
        virtual ~Util();
    };
}
#endif	/* UTIL_HPP */
