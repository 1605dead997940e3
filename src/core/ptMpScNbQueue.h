//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptMpScNbQueue_h
#define ptMpScNbQueue_h

namespace pt
{
  // Unbounded multi-producer/single-consumer queue.
  // push() may be called from any thread. pop() and isempty() may
  // only be called from the single consumer thread.
  // Elements are copied into the queue and are returned in FIFO order.
  template<typename T>
  class MpScNbQueue
  {
  public:

    typedef struct node_str
    {
      std::atomic<struct node_str*> next;
      T                             value;
    } node_t;

    MpScNbQueue()
    {
      node_t* stub = mem::allocZ<node_t>();
      _head = stub;   // last-in
      _tail = stub;   // first-out
    }

    virtual ~MpScNbQueue()
    {
      // release any nodes which were never popped
      while( _tail != nullptr )
      {
        node_t* next = _tail->next.load(std::memory_order_acquire);
        mem::free(_tail);
        _tail = next;
      }
    }

    MpScNbQueue( const MpScNbQueue& ) = delete;
    MpScNbQueue( const MpScNbQueue&& ) = delete;
    MpScNbQueue& operator=(const MpScNbQueue& ) = delete;
    MpScNbQueue& operator=(const MpScNbQueue&& ) = delete;


    void push( const T& value )
    {
      node_t* new_node = mem::allocZ<node_t>(1);

      new_node->value = value;
      new_node->next.store(nullptr);

      // Note that the elements of the queue are only accessed from the end of the queue (tail).
      // New nodes can therefore safely be updated in two steps:

      // 1. Atomically set _head to the new node and return 'old-head'
      node_t* prev = _head.exchange(new_node,std::memory_order_acq_rel);

      // Note that at this point only the new node may have the 'old-head' as it's predecssor.
      // Other threads may therefore safely interrupt at this point.

      // 2. Set the old-head next pointer to the new node (thereby adding the new node to the list)
      prev->next.store(new_node,std::memory_order_release); // RELEASE 'next' to consumer
    }

    // Returns false if the queue is empty.
    bool pop( T& valueRef )
    {
      node_t* t    = _tail;
      node_t* next = t->next.load(std::memory_order_acquire);  //  ACQUIRE 'next' from producer

      if( next == nullptr )
        return false;

      // 'next' becomes the new stub
      _tail    = next;
      valueRef = next->value;
      mem::free(t);

      return true;
    }

    bool isempty() const
    {
      return _tail->next.load(std::memory_order_acquire) == nullptr;  //  ACQUIRE 'next'  from producer
    }

  private:

    node_t*              _tail;
    std::atomic<node_t*> _head;
  };

}


#endif
