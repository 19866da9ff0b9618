/* 
 * File:   CredentialStore.cpp
 * Author: me
 * 
 * Created on March 9, 2024, 12:05 PM
 */

#include "CredentialStore.hpp"

#include <stdexcept>
#include <utility>

using namespace std;

namespace sdsclient
{
    CredentialStore::CredentialStore()
    : mCursor(0)
    {
        // No body
    }

    CredentialStore::~CredentialStore()
    {
        // Empty
    }
    
    void CredentialStore::setMain(const Connection& connection)
    {
        mSlots.clear();
        mSlots.push_back(connection);
        mCursor = 0;
    }
    
    void CredentialStore::addAdditional(const Connection& connection)
    {
        if (mSlots.empty())
        {
            throw logic_error("additional connection without a main one");
        }
        mSlots.push_back(connection);
    }
    
    size_t CredentialStore::size() const
    {
        return mSlots.size();
    }
    
    bool CredentialStore::empty() const
    {
        return mSlots.empty();
    }
    
    const Connection& CredentialStore::get(size_t slot) const
    {
        return mSlots.at(slot);
    }
    
    void CredentialStore::replace(size_t slot, const Connection& connection)
    {
        mSlots.at(slot) = connection;
    }
    
    size_t CredentialStore::cursor() const
    {
        return mCursor;
    }
    
    void CredentialStore::advance()
    {
        if (!mSlots.empty())
        {
            mCursor = (mCursor + 1) % mSlots.size();
        }
    }
    
    void CredentialStore::clear()
    {
        mSlots.clear();
        mCursor = 0;
    }
    
    void CredentialStore::swap(CredentialStore& other)
    {
        mSlots.swap(other.mSlots);
        std::swap(mCursor, other.mCursor);
    }

}
