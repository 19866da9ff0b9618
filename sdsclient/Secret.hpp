/* 
 * File:   Secret.hpp
 * Author: me
 *
 * Created on March 2, 2024, 10:02 PM
 */

#ifndef SECRET_HPP
#define	SECRET_HPP

#include <stddef.h>
#include <string>

namespace sdsclient
{
    /*
     * Holds tokens, passphrases and raw key bytes. The buffer is wiped with 
     * OPENSSL_cleanse() whenever the value is replaced or destroyed. Has no
     * stream operator; call expose() where the raw value is needed.
     */
    class Secret {
    public:
        Secret();
        
        explicit Secret(const std::string& value);
        
        Secret(const char* data, size_t length);
        
        Secret(const Secret& orig);
        
        Secret& operator=(const Secret& orig);
        
        virtual ~Secret();
        
        const std::string& expose() const;
        
        const unsigned char* bytes() const;
        
        size_t size() const;
        
        bool empty() const;
        
        void clear();
        
        bool operator==(const Secret& other) const;
        
        bool operator!=(const Secret& other) const;

    private:
        std::string mValue;
        
        void wipe();
        
    };

}

#endif	/* SECRET_HPP */
