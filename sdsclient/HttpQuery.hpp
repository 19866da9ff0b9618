/* 
 * File:   HttpQuery.hpp
 * Author: me
 *
 * Created on March 6, 2024, 9:43 AM
 */

#ifndef HTTPQUERY_HPP
#define	HTTPQUERY_HPP

#include <string>
#include <utility>
#include <vector>

namespace sdsclient
{
    /*
     * Ordered field/value pairs, URL-escaped on assembly. Used both for query 
     * strings and for application/x-www-form-urlencoded bodies.
     */
    class HttpQuery {
    public:
        HttpQuery();
        
        HttpQuery(const std::string& field, const std::string& value);
        
        virtual ~HttpQuery();
        
        HttpQuery& add(const std::string& field, 
            const std::string& value);
        
        bool empty() const;

        // url + '?' + query
        std::string assemble(const std::string& url) const;
        
        std::string assembleAsPostData() const;

    private:
        std::vector<std::pair<std::string, std::string> > mFields;
        
        static std::string escape(const std::string& str);
        
    };

}

#endif	/* HTTPQUERY_HPP */
