export module Core;

// Re-export all sub-systems so the user only needs 'import Core;'
export import :Error;
export import :Hash;
export import :Logging;
