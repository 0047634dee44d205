export module Core;

// Re-export all sub-systems so the user only needs 'import Core;'
export import :Error;
export import :Logging;
export import :Handle;
export import :Hash;
export import :ResourcePool;
export import :RingQueue;
export import :Tasks;
export import :Clock;
export import :Filesystem;
export import :Assets;
