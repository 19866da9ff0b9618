/* 
 * File:   CredentialStore.hpp
 * Author: me
 *
 * Created on March 9, 2024, 12:05 PM
 */

#ifndef CREDENTIALSTORE_HPP
#define	CREDENTIALSTORE_HPP

#include "Connection.hpp"

#include <stddef.h>
#include <vector>

namespace sdsclient
{
    /*
     * The connections of a session. Slot 0 is the main connection, slots 
     * 1..N-1 the additional connections of the rotation pool. The cursor is
     * the slot that serves the next request.
     * 
     * Not synchronized; TokenManager serializes all access.
     */
    class CredentialStore {
    public:
        CredentialStore();
        
        virtual ~CredentialStore();
        
        // Replaces everything with a single main connection
        void setMain(const Connection& connection);
        
        void addAdditional(const Connection& connection);
        
        // Number of slots, main included. 0 when empty.
        size_t size() const;
        
        bool empty() const;
        
        const Connection& get(size_t slot) const;
        
        void replace(size_t slot, const Connection& connection);
        
        size_t cursor() const;
        
        // Moves the cursor to the next slot, wrapping back to main
        void advance();
        
        // Drops every connection. Their secrets are wiped on destruction.
        void clear();
        
        void swap(CredentialStore& other);
        
    private:
        std::vector<Connection> mSlots;
        size_t mCursor;
        
        CredentialStore(const CredentialStore& orig);
    };

}

#endif	/* CREDENTIALSTORE_HPP */
